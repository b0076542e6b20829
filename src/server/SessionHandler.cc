/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "SessionHandler.hh"
#include "ApiResponse.hh"
#include "RequestTarget.hh"

#include "net/MultipartForm.hh"
#include "report/ReportLinker.hh"
#include "store/BlobReader.hh"
#include "store/BlobStore.hh"
#include "store/LegacyResolver.hh"
#include "upload/ChunkWriter.hh"
#include "upload/SessionRegistry.hh"
#include "upload/UploadAssembler.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/beast/version.hpp>

#include <charconv>
#include <memory>
#include <mutex>

namespace shg {
namespace {

const std::uint64_t small_body_limit = 64 * 1024;

std::string_view header_value(const RequestHeader& header, http::field field)
{
	auto value = header[field];
	return {value.data(), value.size()};
}

std::string_view target_of(const RequestHeader& header)
{
	auto target = header.target();
	return {target.data(), target.size()};
}

// "image/jpeg; charset=binary" -> "image/jpeg"
std::string media_type(std::string_view content_type)
{
	return to_lower(trim(std::get<0>(split_left(content_type, ";"))));
}

std::optional<std::int64_t> to_int(std::string_view s)
{
	s = trim(s);
	std::int64_t result{};
	auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
	if (s.empty() || ec != std::errc{} || end != s.data() + s.size())
		return std::nullopt;
	return result;
}

/// Fields of a request from its body, which may be multipart/form-data, urlencoded
/// or JSON, or from its query string.
class RequestFields
{
public:
	RequestFields(const RequestHeader& header, std::string_view body, const RequestTarget& target, std::error_code& ec) :
		m_target{target}
	{
		auto content_type = header_value(header, http::field::content_type);
		auto mime = media_type(content_type);

		if (auto boundary = MultipartForm::boundary(content_type); boundary.has_value())
		{
			m_form = MultipartForm{body, *boundary, ec};
			m_multipart = true;
		}
		else if (mime == "application/json")
		{
			m_json = nlohmann::json::parse(body, nullptr, false);
			if (m_json.is_discarded() || !m_json.is_object())
				ec = Error::invalid_argument;
		}
		else if (mime == "application/x-www-form-urlencoded")
			m_urlencoded = body;
	}

	std::optional<std::string> get(std::string_view name) const
	{
		if (auto value = m_form.field(name); value.has_value())
			return value;

		if (m_json.is_object())
		{
			if (auto it = m_json.find(std::string{name}); it != m_json.end() && !it->is_null())
				return it->is_string() ? it->get<std::string>() : it->dump();
		}

		if (!m_urlencoded.empty())
		{
			auto [value] = find_optional_fields(m_urlencoded, name);
			if (value.has_value())
				return url_decode(*value, true);
		}
		return m_target.option(name);
	}

	std::string value(std::string_view name) const
	{
		return std::string{trim(get(name).value_or(""))};
	}

	[[nodiscard]] bool multipart() const {return m_multipart;}
	[[nodiscard]] const MultipartForm& form() const {return m_form;}

private:
	const RequestTarget& m_target;

	MultipartForm       m_form;
	bool                m_multipart{false};
	nlohmann::json      m_json;
	std::string_view    m_urlencoded;
};

// <reportId>_<epoch ms>_<original name>
std::string stored_filename(const std::string& report_id, const std::string& name)
{
	return report_id + "_" + std::to_string(Timestamp::now().time_since_epoch().count()) + "_" + name;
}

nlohmann::json file_json(const BlobInfo& info)
{
	return {
		{"id",          info.id.hex()},
		{"filename",    info.filename},
		{"contentType", info.mime},
		{"size",        info.size},
		{"bucket",      info.bucket},
		{"uploadDate",  info.upload_date.iso8601()},
		{"metadata",    info.metadata}
	};
}

nlohmann::json photo_json(const BlobInfo& info)
{
	nlohmann::json photo{
		{"id",           info.id.hex()},
		{"filename",     info.filename},
		{"originalName", info.field(meta::original_name)},
		{"contentType",  info.mime},
		{"size",         info.size},
		{"path",         "/api/photos/" + info.id.hex()},
		{"status",       "pending"},
		{"uploadDate",   info.upload_date.iso8601()}
	};
	if (auto client_id = info.field(meta::client_id); !client_id.empty())
		photo.emplace("clientId", client_id);
	return photo;
}

BlobInfo photo_target(const std::string& bucket, const std::string& report_id, const std::string& name, const std::string& mime, const std::string& client_id)
{
	BlobInfo target;
	target.bucket   = bucket;
	target.filename = stored_filename(report_id, name);
	target.mime     = mime.empty() ? "application/octet-stream" : mime;
	target.metadata = {
		{meta::owner_id,      report_id},
		{meta::original_name, name},
		{meta::upload_date,   Timestamp::now().iso8601()}
	};
	if (!client_id.empty())
		target.metadata.emplace(meta::client_id, client_id);
	return target;
}

// Filename in Content-Disposition: no quotes or control characters
std::string disposition_filename(std::string_view name)
{
	std::string result;
	for (unsigned char c : name)
		if (c >= 0x20 && c != '\"' && c != '\\' && c != 0x7f)
			result.push_back(static_cast<char>(c));
	return result;
}

} // end of local namespace

void SessionHandler::Responder::send(http::status status, const nlohmann::json& body) const
{
	json(json_response(status, body, version));
}

void SessionHandler::Responder::error(std::error_code ec, std::string_view message, nlohmann::json&& details) const
{
	json(json_response(
		http_status(ec),
		failure(message.empty() ? ec.message() : message, std::move(details)),
		version
	));
}

SessionHandler::SessionHandler(const Services& services) : m_svc{services}
{
}

SessionHandler::RequestBodyType SessionHandler::body_type(const RequestHeader& header) const
{
	return header.method() == http::verb::post || header.method() == http::verb::put ?
		RequestBodyType::string : RequestBodyType::empty;
}

std::uint64_t SessionHandler::body_limit(const RequestHeader& header) const
{
	RequestTarget target{target_of(header)};

	if (target.match({"api", "photos", "upload"}))
		return m_svc.cfg.max_request_size();
	if (target.match({"api", "photos", "*", "thumbnail"}))
		return m_svc.cfg.max_object_size();

	// the chunk and the form fields around it
	if (target.match({"api", "photos", "upload-chunk"}))
		return m_svc.cfg.max_chunk_size() + small_body_limit;

	return small_body_limit;
}

void SessionHandler::handle(const RequestHeader& header, std::string_view body, Responder&& res)
{
	RequestTarget target{target_of(header)};
	auto method = header.method();

	if (target.size() < 3 || target[0] != "api")
		return res.send(http::status::not_found, failure("Route not found"));

	if (target[1] == "photos")
	{
		if (method == http::verb::post)
		{
			if (target.match({"api", "photos", "upload-chunk", "init"}))
				return on_init(header, body, target, res);
			if (target.match({"api", "photos", "upload-chunk"}))
				return on_chunk(header, body, target, res);
			if (target.match({"api", "photos", "complete-upload"}))
				return on_complete(header, body, target, res);
			if (target.match({"api", "photos", "upload"}))
				return on_batch_upload(header, body, target, res);
		}
		else if (method == http::verb::get)
		{
			if (target.match({"api", "photos", "upload", "*"}))
				return on_status(target, res);
			if (target.match({"api", "photos", "*"}))
				return on_get_photo(target, res);
		}
		else if (method == http::verb::put && target.match({"api", "photos", "*", "thumbnail"}))
			return on_put_thumbnail(header, body, target, res);
		else if (method == http::verb::delete_ && target.match({"api", "photos", "*"}))
			return on_delete_photo(target, res);
	}

	else if (target[1] == "files")
	{
		if (method == http::verb::get)
		{
			// the fixed routes go before /api/files/{id}
			if (target.match({"api", "files", "search"}))
				return on_search(target, res);
			if (target.match({"api", "files", "resolve"}))
				return on_resolve(target, res);
			if (target.match({"api", "files", "info", "*"}))
				return on_info(target, res);
			if (target.match({"api", "files", "*"}))
				return on_get_file(target, res);
		}
		else if (method == http::verb::delete_ && target.match({"api", "files", "*"}))
			return on_delete_file(target, res);
	}

	res.send(http::status::not_found, failure("Route not found"));
}

std::string SessionHandler::bucket_of(const std::optional<std::string>& requested, std::error_code& ec) const
{
	if (!requested.has_value() || requested->empty())
		return m_svc.cfg.default_bucket();

	if (!m_svc.cfg.valid_bucket(*requested))
		ec = Error::invalid_argument;
	return *requested;
}

bool SessionHandler::chunk_type_allowed(std::string_view mime) const
{
	auto type = media_type(mime);
	return type.empty() ||
		type == "application/octet-stream" ||
		type == "binary/octet-stream" ||
		m_svc.cfg.allowed_type(type);
}

void SessionHandler::on_init(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	RequestFields fields{header, body, target, ec};
	if (ec)
		return res.error(ec, "Malformed request body");

	auto report_id = fields.value("reportId");
	auto filename  = fields.value("filename");
	auto total     = to_int(fields.value("totalChunks"));
	if (report_id.empty() || filename.empty() || !total.has_value())
		return res.error(Error::invalid_argument, "Missing required fields", {{"required", {"reportId", "filename", "totalChunks"}}});

	if (*total <= 0 || static_cast<std::uint64_t>(*total) > m_svc.cfg.max_chunks())
		return res.error(Error::invalid_argument, "totalChunks out of range", {{"max", m_svc.cfg.max_chunks()}});

	auto mime = media_type(fields.value("contentType"));
	if (mime.empty())
		mime = "application/octet-stream";
	if (!m_svc.cfg.allowed_type(mime))
		return res.error(Error::unsupported_type, "Content type not allowed", {{"allowed", m_svc.cfg.allowed_types()}});

	auto bucket = bucket_of(fields.get("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto id = m_svc.registry.create(*total, photo_target(bucket, report_id, filename, mime, fields.value("clientId")), ec);
	if (ec)
		return res.error(ec);

	Log(LOG_INFO, "upload %1% initialized: \"%2%\" in %3% chunks for report %4%", to_hex(id), filename, *total, report_id);
	res.send(http::status::ok, success({
		{"fileId",      to_hex(id)},
		{"totalChunks", *total},
		{"filename",    filename},
		{"status",      "initialized"}
	}, "Upload initialized"));
}

void SessionHandler::on_chunk(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	RequestFields fields{header, body, target, ec};
	if (ec)
		return res.error(ec, "Malformed request body");

	// either a multipart form with a "chunk" file, or the raw chunk as the body
	std::string_view chunk;
	std::string_view chunk_type;
	if (fields.multipart())
	{
		auto part = fields.form().find("chunk");
		if (!part)
			return res.error(Error::invalid_argument, "No chunk data received");

		chunk      = part->data;
		chunk_type = part->content_type;
	}
	else
	{
		chunk      = body;
		chunk_type = header_value(header, http::field::content_type);
	}

	if (!chunk_type_allowed(chunk_type))
		return res.error(Error::unsupported_type, "Chunk content type not allowed");

	auto file_id = fields.value("fileId");
	auto index   = to_int(fields.value("chunkIndex"));
	auto total   = to_int(fields.value("totalChunks"));
	if (file_id.empty() || !index.has_value() || !total.has_value())
		return res.error(Error::invalid_argument, "Missing required fields", {{"required", {"fileId", "chunkIndex", "totalChunks"}}});

	auto session = m_svc.registry.find(file_id, ec);
	if (ec)
		return res.error(ec, "Upload session not found");

	if (*total != static_cast<std::int64_t>(session->total()))
		return res.error(Error::invalid_argument, "totalChunks does not match the upload session", {{"totalChunks", session->total()}});

	auto progress = m_svc.writer.write(session->id(), *index, chunk, ec);
	if (ec)
		return res.error(ec, {}, {{"fileId", file_id}, {"chunkIndex", *index}});

	res.send(http::status::ok, success({
		{"fileId",      file_id},
		{"chunkIndex",  *index},
		{"received",    progress.received},
		{"totalChunks", progress.total}
	}, "Chunk received"));
}

void SessionHandler::on_complete(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	RequestFields fields{header, body, target, ec};
	if (ec)
		return res.error(ec, "Malformed request body");

	auto file_id   = fields.value("fileId");
	auto report_id = fields.value("reportId");
	if (file_id.empty() || report_id.empty())
		return res.error(Error::invalid_argument, "Missing required fields", {{"required", {"fileId", "reportId"}}});

	auto session = m_svc.registry.find(file_id, ec);
	if (ec)
		return res.error(ec, "Upload session not found");

	if (session->target().field(meta::owner_id) != report_id)
		return res.error(Error::invalid_argument, "reportId does not match the upload session");

	std::vector<std::size_t> missing;
	auto blob = m_svc.assembler.complete(session->id(), ec, &missing);
	if (ec == Error::incomplete_upload)
		return res.error(ec, "Upload is incomplete", {
			{"missing",      missing},
			{"missingCount", missing.size()},
			{"received",     session->received()},
			{"totalChunks",  session->total()}
		});
	if (ec == Error::not_found)
		return res.error(ec, "Upload session not found");
	if (ec)
		return res.error(ec, "Failed to assemble the upload", {{"fileId", file_id}});

	auto photo = photo_json(blob);
	m_svc.linker.link_photo(report_id, blob.id, photo, [res, photo](std::error_code link_ec)
	{
		if (link_ec)
			res.send(http::status::internal_server_error, failure(
				"Photo stored but not linked to the report",
				{{"photoId", photo["id"]}, {"reason", link_ec.message()}}
			));
		else
			res.send(http::status::ok, success({{"photo", photo}}, "Chunked upload completed successfully"));
	});
}

void SessionHandler::on_status(const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	auto session = m_svc.registry.find(target[3], ec);
	if (ec)
		return res.error(ec, "Upload session not found");

	res.send(http::status::ok, success({
		{"fileId",      target[3]},
		{"received",    session->received()},
		{"totalChunks", session->total()},
		{"missing",     session->missing()}
	}));
}

void SessionHandler::on_batch_upload(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	RequestFields fields{header, body, target, ec};
	if (ec || !fields.multipart())
		return res.error(Error::invalid_argument, "multipart/form-data expected");

	auto report_id = fields.value("reportId");
	if (report_id.empty())
		return res.error(Error::invalid_argument, "Missing required fields", {{"required", {"reportId"}}});

	auto bucket = bucket_of(fields.get("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto files = fields.form().find_all("photo");
	if (files.empty())
		files = fields.form().find_all("photos");
	if (files.empty())
		return res.error(Error::invalid_argument, "No files uploaded");

	// client IDs in the same order as the files: either a JSON array in "clientIds"
	// or one "clientId" field per file
	std::vector<std::string> client_ids;
	if (auto ids = fields.get("clientIds"); ids.has_value())
	{
		auto json = nlohmann::json::parse(*ids, nullptr, false);
		if (json.is_array())
			for (auto&& id : json)
				client_ids.push_back(id.is_string() ? id.get<std::string>() : id.dump());
	}
	else
	{
		for (auto&& part : fields.form().find_all("clientId"))
			client_ids.emplace_back(part->data);
	}

	struct Batch
	{
		std::mutex mutex;
		std::size_t pending{};
		std::vector<nlohmann::json> photos;
		nlohmann::json errors = nlohmann::json::array();
		nlohmann::json mapping = nlohmann::json::object();
		std::error_code first_error;
	};
	auto batch = std::make_shared<Batch>();
	batch->photos.resize(files.size());

	auto fail = [batch](std::size_t index, const std::string& filename, std::error_code ec)
	{
		batch->errors.push_back({{"index", index}, {"filename", filename}, {"error", ec.message()}});
		if (!batch->first_error)
			batch->first_error = ec;
	};

	auto finish = [res, total=files.size()](Batch& batch)
	{
		nlohmann::json photos = nlohmann::json::array();
		for (auto&& photo : batch.photos)
			if (!photo.is_null())
				photos.push_back(std::move(photo));

		if (photos.empty())
			return res.error(batch.first_error, "No photo was uploaded", {{"errors", batch.errors}});

		auto successful = photos.size();
		res.send(http::status::ok, success(
			{{"photos", std::move(photos)}, {"idMapping", batch.mapping}},
			std::to_string(successful) + " photo(s) uploaded",
			{{"total", total}, {"successful", successful}, {"failed", total - successful}, {"errors", batch.errors}}
		));
	};

	// store all files before linking them, as the request body goes away
	// when this function returns
	std::vector<std::tuple<std::size_t, BlobInfo, std::string>> stored;
	for (std::size_t i = 0; i < files.size(); i++)
	{
		auto part      = files[i];
		auto client_id = i < client_ids.size() ? client_ids[i] : std::string{};
		auto mime      = media_type(part->content_type);

		std::error_code put_ec;
		BlobInfo blob;
		if (part->data.size() > m_svc.cfg.max_object_size())
			put_ec = Error::too_large;
		else if (!m_svc.cfg.allowed_type(mime))
			put_ec = Error::unsupported_type;
		else
			blob = m_svc.store.put(part->data, photo_target(bucket, report_id, part->filename, mime, client_id), put_ec);

		if (put_ec)
		{
			Log(LOG_WARNING, "cannot store \"%1%\" for report %2%: %3%", part->filename, report_id, put_ec.message());
			fail(i, part->filename, put_ec);
		}
		else
			stored.emplace_back(i, std::move(blob), client_id);
	}

	batch->pending = stored.size();
	if (stored.empty())
		return finish(*batch);

	for (auto&& [index, blob, client_id] : stored)
	{
		auto photo = photo_json(blob);
		m_svc.linker.link_photo(report_id, blob.id, photo, [
			batch, finish, fail, index=index, photo, client_id=client_id, filename=blob.field(meta::original_name)
		](std::error_code link_ec) mutable
		{
			std::unique_lock lock{batch->mutex};
			if (link_ec)
				fail(index, filename, link_ec);
			else
			{
				if (!client_id.empty())
					batch->mapping[client_id] = photo["id"];
				batch->photos[index] = std::move(photo);
			}

			if (--batch->pending == 0)
				finish(*batch);
		});
	}
}

http::response<BlobResponseBody> SessionHandler::blob_response(BlobStream&& blob, unsigned version)
{
	auto info = blob.info();

	http::response<BlobResponseBody> res{
		std::piecewise_construct,
		std::make_tuple(std::move(blob)),
		std::make_tuple(http::status::ok, version)
	};
	res.set(http::field::content_type, info.mime);
	res.set(http::field::content_disposition, "inline; filename=\"" + disposition_filename(info.filename) + "\"");
	res.set(http::field::cache_control, "private, max-age=31536000, immutable");
	res.set(http::field::etag, to_quoted_hex(info.id));
	res.set(http::field::last_modified, info.upload_date.http_format());
	res.content_length(info.size);
	return res;
}

void SessionHandler::on_get_photo(const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	auto blob = m_svc.reader.stream(target[2], target.option("size", BlobReader::original), target.option("bucket", ""), ec);
	if (ec)
		return res.error(ec, ec == Error::not_found ? "Photo not found" : "");

	res.blob(blob_response(std::move(blob), res.version));
}

void SessionHandler::on_put_thumbnail(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res)
{
	auto id = ObjectID::from_hex(target[2]);
	if (!id.has_value())
		return res.error(Error::invalid_argument, "Invalid photo ID");

	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto original = m_svc.store.info(*id, bucket, ec);
	if (ec)
		return res.error(ec, ec == Error::not_found ? "Photo not found" : "");

	if (body.empty())
		return res.error(Error::invalid_argument, "No thumbnail data received");

	auto mime = media_type(header_value(header, http::field::content_type));

	BlobInfo thumb;
	thumb.bucket   = bucket;
	thumb.filename = original.filename;
	thumb.mime     = mime.empty() ? original.mime : mime;
	thumb.metadata = {
		{meta::variant_of, id->hex()},
		{meta::variant,    BlobReader::thumbnail},
		{meta::owner_id,   original.field(meta::owner_id)}
	};

	// Replace the existing thumbnail, if any. Another PUT may store its thumbnail
	// between remove() and put_at(), so remove it once more and try again.
	auto thumb_id = id->derive(BlobReader::thumbnail);
	BlobInfo stored;
	for (int attempt = 0 ; attempt < 2 ; attempt++)
	{
		m_svc.store.remove(thumb_id, bucket, ec);
		if (ec)
			break;

		StringSource src{body};
		stored = m_svc.store.put_at(thumb_id, src, thumb, ec);
		if (ec != Error::already_exists)
			break;

		Log(LOG_NOTICE, "thumbnail of %1% was replaced by another request. Retrying.", *id);
	}
	if (ec)
		return res.error(ec, "Failed to store the thumbnail");

	res.send(http::status::ok, success({
		{"id",          id->hex()},
		{"thumbnailId", stored.id.hex()},
		{"size",        stored.size}
	}, "Thumbnail stored"));
}

void SessionHandler::remove_with_variants(const ObjectID& id, const std::string& bucket, std::error_code& ec)
{
	m_svc.store.remove(id, bucket, ec);
	if (!ec)
		m_svc.store.remove(id.derive(BlobReader::thumbnail), bucket, ec);
}

void SessionHandler::on_delete_photo(const RequestTarget& target, const Responder& res)
{
	auto id = ObjectID::from_hex(target[2]);
	if (!id.has_value())
		return res.error(Error::invalid_argument, "Invalid photo ID");

	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	// unlink from the report first, so the report never refers to a missing photo
	m_svc.linker.unlink_photo(*id, [this, res, id=*id, bucket](std::error_code unlink_ec)
	{
		if (!unlink_ec)
			remove_with_variants(id, bucket, unlink_ec);

		if (unlink_ec)
			res.error(unlink_ec, "Failed to delete the photo");
		else
			res.send(http::status::ok, success({{"photoId", id.hex()}}, "Photo deleted"));
	});
}

void SessionHandler::on_get_file(const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	auto blob = m_svc.reader.stream(target[2], BlobReader::original, target.option("bucket", ""), ec);
	if (ec)
		return res.error(ec, ec == Error::not_found ? "File not found" : "");

	res.blob(blob_response(std::move(blob), res.version));
}

void SessionHandler::on_info(const RequestTarget& target, const Responder& res)
{
	auto id = ObjectID::from_hex(target[3]);
	if (!id.has_value())
		return res.error(Error::invalid_argument, "Invalid file ID");

	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto info = m_svc.store.info(*id, bucket, ec);
	if (ec)
		return res.error(ec, ec == Error::not_found ? "File not found" : "");

	res.send(http::status::ok, success(file_json(info)));
}

void SessionHandler::on_delete_file(const RequestTarget& target, const Responder& res)
{
	auto id = ObjectID::from_hex(target[2]);
	if (!id.has_value())
		return res.error(Error::invalid_argument, "Invalid file ID");

	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	remove_with_variants(*id, bucket, ec);
	if (ec)
		return res.error(ec, "Failed to delete the file");

	res.send(http::status::ok, success({{"id", id->hex()}}, "File deleted"));
}

void SessionHandler::on_search(const RequestTarget& target, const Responder& res)
{
	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto found = m_svc.store.find(BlobQuery::from_url(target.query()), bucket, ec);
	if (ec)
		return res.error(ec, "Search failed");

	nlohmann::json files = nlohmann::json::array();
	for (auto&& info : found)
		files.push_back(file_json(info));

	res.send(http::status::ok, success({{"count", found.size()}, {"files", std::move(files)}}));
}

void SessionHandler::on_resolve(const RequestTarget& target, const Responder& res)
{
	auto name = target.option("name", "");
	if (name.empty())
		return res.error(Error::invalid_argument, "Missing required parameter", {{"required", {"name"}}});

	std::error_code ec;
	auto bucket = bucket_of(target.option("bucket"), ec);
	if (ec)
		return res.error(ec, "Unknown bucket");

	auto found = m_svc.resolver.resolve(name, bucket, ec);
	if (ec)
		return res.error(ec, "Resolution failed");

	nlohmann::json files = nlohmann::json::array();
	for (auto&& info : found)
		files.push_back(file_json(info));

	res.send(http::status::ok, success({{"count", found.size()}, {"files", std::move(files)}}));
}

} // end of namespace shg
