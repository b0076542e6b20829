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

#include "ReportLinker.hh"

namespace shg {
namespace redis { class Pool; }

/// \brief  Keeps the photo list of the reports in redis
/// "report-photos:<report ID>" is a hash of blob ID to the JSON of the photo.
/// "photo-report:<blob ID>" is the report ID the photo belongs to.
class RedisReportLinker : public ReportLinker
{
public:
	explicit RedisReportLinker(redis::Pool& pool);

	void link_photo(const std::string& report_id, const ObjectID& blob, const nlohmann::json& photo, Completion&& comp) override;
	void unlink_photo(const ObjectID& blob, Completion&& comp) override;

private:
	redis::Pool& m_pool;
};

} // end of namespace shg
