#include "odata_batch_writer.hpp"
#include "tracing.hpp"

#include <algorithm>
#include <sstream>

namespace odata_writer {

static const char *CRLF = "\r\n";

static std::string RandomBoundary(const std::string &prefix)
{
    return prefix + duckdb::UUID::ToString(duckdb::UUID::GenerateRandomUUID());
}

// ----------------------------------------------------------------------

int64_t ODataBatchWriter::NextContentId()
{
    std::lock_guard<std::mutex> lock(content_id_mutex);
    return ++last_content_id;
}

void ODataBatchWriter::MapContentId(EntityDataPtr data, int64_t content_id)
{
    if (!data) {
        throw duckdb::InvalidInputException("Cannot map content id " + std::to_string(content_id) + " to null entity data");
    }
    std::lock_guard<std::mutex> lock(content_id_mutex);
    auto key = data.get();
    content_ids[key] = std::make_pair(std::move(data), content_id);
}

std::optional<int64_t> ODataBatchWriter::GetContentId(const EntityData &data) const
{
    std::lock_guard<std::mutex> lock(content_id_mutex);
    auto it = content_ids.find(&data);
    if (it == content_ids.end()) {
        return std::nullopt;
    }
    return it->second.second;
}

// ----------------------------------------------------------------------

ODataMultipartBatchWriter::ODataMultipartBatchWriter(std::string service_root, std::string batch_boundary,
                                                     std::string changeset_boundary)
    : service_root(std::move(service_root)),
      batch_boundary(batch_boundary.empty() ? RandomBoundary("batch_") : std::move(batch_boundary)),
      changeset_boundary(changeset_boundary.empty() ? RandomBoundary("changeset_") : std::move(changeset_boundary))
{ }

void ODataMultipartBatchWriter::StartBatch()
{
    if (started) {
        throw duckdb::InvalidInputException("Batch " + batch_boundary + " has already been started");
    }
    started = true;
    ODATA_WRITER_TRACE_DEBUG("ODATA_BATCH", "Started batch " + batch_boundary);
}

ODataRequestMessage &ODataMultipartBatchWriter::CreateOperationRequestMessage(HttpMethod method, const std::string &url)
{
    if (!started || ended) {
        throw duckdb::InvalidInputException("Batch " + batch_boundary + " does not accept operations");
    }

    operations.push_back(std::make_unique<ODataRequestMessage>(method, url));
    ODATA_WRITER_TRACE_TRACE("ODATA_BATCH", "Operation " + std::to_string(operations.size()) + ": " + method.ToString() + " " + url);
    return *operations.back();
}

std::string ODataMultipartBatchWriter::OperationUrl(const std::string &url) const
{
    if (service_root.empty() || url.rfind("$", 0) == 0 || url.find("://") != std::string::npos) {
        return url;
    }
    if (service_root.back() == '/') {
        return service_root + url;
    }
    return service_root + "/" + url;
}

std::string ODataMultipartBatchWriter::EndBatch()
{
    if (!started || ended) {
        throw duckdb::InvalidInputException("Batch " + batch_boundary + " is not open");
    }
    ended = true;

    std::stringstream ss;
    ss << "--" << batch_boundary << CRLF;
    ss << "Content-Type: multipart/mixed; boundary=" << changeset_boundary << CRLF << CRLF;

    for (const auto &operation : operations) {
        ss << "--" << changeset_boundary << CRLF;
        ss << "Content-Type: application/http" << CRLF;
        ss << "Content-Transfer-Encoding: binary" << CRLF;
        if (operation->HasHeader("Content-ID")) {
            ss << "Content-ID: " << operation->GetHeader("Content-ID") << CRLF;
        }
        ss << CRLF;

        ss << operation->method.ToString() << " " << OperationUrl(operation->url) << " HTTP/1.1" << CRLF;

        std::vector<std::pair<std::string, std::string>> headers(operation->headers.begin(), operation->headers.end());
        std::sort(headers.begin(), headers.end());
        for (const auto &header : headers) {
            if (duckdb::StringUtil::CIEquals(header.first, "Content-ID")) {
                continue;
            }
            ss << header.first << ": " << header.second << CRLF;
        }
        ss << CRLF;
        if (!operation->body.empty()) {
            ss << operation->body << CRLF;
        }
    }

    ss << "--" << changeset_boundary << "--" << CRLF;
    ss << "--" << batch_boundary << "--" << CRLF;

    ODATA_WRITER_TRACE_DEBUG("ODATA_BATCH", "Ended batch " + batch_boundary + " with " + std::to_string(operations.size()) + " operations");
    return ss.str();
}

std::string ODataMultipartBatchWriter::ContentType() const
{
    return "multipart/mixed; boundary=" + batch_boundary;
}

// ----------------------------------------------------------------------

DeferredBatchWriter::DeferredBatchWriter(Factory factory)
    : factory(std::move(factory))
{
    if (!this->factory) {
        throw duckdb::InvalidInputException("DeferredBatchWriter requires a batch writer factory");
    }
}

ODataBatchWriter &DeferredBatchWriter::GetStartedWriter()
{
    std::call_once(start_flag, [this]() {
        auto created = factory();
        if (!created) {
            throw duckdb::InvalidInputException("Batch writer factory returned no writer");
        }
        created->StartBatch();
        writer = std::move(created);
        started.store(true);
    });
    return *writer;
}

std::string DeferredBatchWriter::EndBatch()
{
    std::lock_guard<std::mutex> lock(operation_lock);
    return GetStartedWriter().EndBatch();
}

std::string DeferredBatchWriter::ContentType()
{
    return GetStartedWriter().ContentType();
}

} // namespace odata_writer
