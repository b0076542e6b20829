/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#pragma once

namespace shg {

class BlobReader;
class BlobStore;
class ChunkWriter;
class Configuration;
class LegacyResolver;
class ReportLinker;
class SessionRegistry;
class UploadAssembler;

/// The components a SessionHandler works with. They are owned by the Server,
/// or by the unit tests.
struct Services
{
	const Configuration&    cfg;
	BlobStore&              store;
	SessionRegistry&        registry;
	ChunkWriter&            writer;
	UploadAssembler&        assembler;
	const BlobReader&       reader;
	const LegacyResolver&   resolver;
	ReportLinker&           linker;
};

} // end of namespace shg
