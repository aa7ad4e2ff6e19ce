#include "odata_request_writer.hpp"
#include "error_context.hpp"
#include "odata_edm_delta_model.hpp"
#include "tracing.hpp"

namespace odata_writer {

static ODataWriterSettings ResolveVersion(ODataWriterSettings settings, const ODataMetadata &metadata)
{
    if (settings.odata_version == ODataVersion::UNKNOWN) {
        settings.odata_version = metadata.Version() == ODataVersion::UNKNOWN ? ODataVersion::V4 : metadata.Version();
    }
    return settings;
}

ODataRequestWriter::ODataRequestWriter(ODataWriterSettings settings, std::shared_ptr<const ODataMetadata> metadata,
                                       std::shared_ptr<DeferredBatchWriter> batch)
    : metadata(std::move(metadata)), batch(std::move(batch))
{
    if (!this->metadata) {
        throw duckdb::InvalidInputException("ODataRequestWriter requires service metadata");
    }

    this->settings = ResolveVersion(std::move(settings), *this->metadata);
    if (this->settings.trace_enabled) {
        this->settings.ApplyTracing();
    }
    payload_writer = ODataPayloadWriter::Create(this->settings);

    ODATA_WRITER_TRACE_DEBUG("ODATA_WRITER", "Created " + ODataVersionToString(this->settings.odata_version) + " " +
                             PayloadFormatToString(this->settings.payload_format) + " writer" +
                             (this->batch ? " in batch mode" : ""));
}

std::optional<std::string> ODataRequestWriter::WriteEntryContent(HttpMethod method, const std::string &collection,
                                                                  const EntityData &data, const std::string &command_text)
{
    if (batch) {
        throw duckdb::InvalidInputException("Batched writes to '" + collection + "' require shared entity data (EntityDataPtr)");
    }

    auto message = WriteEntryRequest(method, collection, data, command_text);
    if (method == HttpMethod::_DELETE) {
        return std::nullopt;
    }
    return message.body;
}

std::optional<std::string> ODataRequestWriter::WriteEntryContent(HttpMethod method, const std::string &collection,
                                                                  EntityDataPtr data, const std::string &command_text)
{
    if (!data) {
        throw duckdb::InvalidInputException("Cannot write null entity data to '" + collection + "'");
    }
    if (!batch) {
        return WriteEntryContent(method, collection, *data, command_text);
    }

    auto entity_set = metadata->FindEntitySet(collection);
    auto &writer = batch->GetStartedWriter();

    std::lock_guard<std::mutex> lock(batch->OperationLock());

    // Encode before the operation exists so a failed encode leaves the batch untouched
    std::string body;
    if (method != HttpMethod::_DELETE) {
        body = EncodeBody(method, entity_set, *data, &writer);
    }

    auto &message = writer.CreateOperationRequestMessage(method, command_text);
    if (method != HttpMethod::_DELETE) {
        auto content_id = writer.NextContentId();
        writer.MapContentId(data, content_id);
        message.SetHeader("Content-ID", std::to_string(content_id));
        ODATA_WRITER_TRACE_DEBUG("ODATA_WRITER", method.ToString() + " " + command_text + " queued as content id " + std::to_string(content_id));
    }
    ApplyHeaders(message, entity_set);
    if (method != HttpMethod::_DELETE) {
        message.SetBody(std::move(body), payload_writer->ContentType());
    }

    return std::nullopt;
}

ODataRequestMessage ODataRequestWriter::WriteEntryRequest(HttpMethod method, const std::string &collection,
                                                          const EntityData &data, const std::string &command_text) const
{
    if (batch) {
        throw duckdb::InvalidInputException("Standalone requests cannot be written by a batch writer");
    }

    auto entity_set = metadata->FindEntitySet(collection);
    ODataRequestMessage message(method, command_text);
    ApplyHeaders(message, entity_set);
    if (method != HttpMethod::_DELETE) {
        message.SetBody(EncodeBody(method, entity_set, data, nullptr), payload_writer->ContentType());
    }

    ODATA_WRITER_TRACE_DEBUG("ODATA_WRITER", "Wrote " + method.ToString() + " " + command_text + " (" +
                             std::to_string(message.body.size()) + " bytes)");
    return message;
}

std::string ODataRequestWriter::WriteLinkContent(const std::string &link_path) const
{
    ODATA_WRITER_TRACE_DEBUG("ODATA_WRITER", "Writing reference link to " + link_path);
    return payload_writer->WriteEntityReferenceLink(link_path);
}

std::string ODataRequestWriter::ContentType() const
{
    return payload_writer->ContentType();
}

std::string ODataRequestWriter::LinkContentType() const
{
    return payload_writer->ReferenceLinkContentType();
}

std::string ODataRequestWriter::EncodeBody(HttpMethod method, const EntitySet &entity_set, const EntityData &data,
                                           const ODataBatchWriter *batch_writer) const
{
    ScopedErrorContext ctx;
    ctx.Set("entity_set", entity_set.name).Set("method", method.ToString());

    ODataEntryEncoder::ContentIdLookup content_ids;
    if (batch_writer) {
        content_ids = [batch_writer](const EntityData &target) { return batch_writer->GetContentId(target); };
    }
    ODataEntryEncoder encoder(*metadata, std::move(content_ids));

    auto entity_type = metadata->FindEntityType(entity_set.entity_type_name);

    ODataEntry entry;
    if (method.IsPartialUpdate()) {
        EdmDeltaModel delta(metadata->Model(), entity_type, DeclaredFieldNames(entity_type, data));
        ODATA_WRITER_TRACE_TRACE("ODATA_WRITER", ctx.Format("Partial update restricted to " +
                                 std::to_string(delta.RestrictedType().properties.size()) + " properties"));
        entry = encoder.Encode(delta, entity_type.FullName(), data);
    } else {
        entry = encoder.Encode(metadata->Model(), entity_type.FullName(), data);
    }

    return payload_writer->WriteEntry(entry);
}

void ODataRequestWriter::ApplyHeaders(ODataRequestMessage &message, const EntitySet &entity_set) const
{
    if (settings.odata_version == ODataVersion::V2) {
        message.SetHeader("DataServiceVersion", "2.0");
    } else {
        message.SetHeader("OData-Version", "4.0");
    }

    if (message.method.ModifiesExisting() &&
        metadata->EntitySetTypeRequiresOptimisticConcurrencyCheck(entity_set.name)) {
        message.SetHeader("If-Match", "*");
    }
}

std::vector<std::string> ODataRequestWriter::DeclaredFieldNames(const EntityType &entity_type, const EntityData &data) const
{
    const auto &model = metadata->Model();
    const auto &matcher = metadata->NameMatcher();
    auto properties = AllProperties(model, entity_type);
    auto navigation_properties = AllNavigationProperties(model, entity_type);

    std::vector<std::string> names;
    for (const auto &field : data.Fields()) {
        if (auto property = matcher.BestMatch(properties, field.first, [](const Property &p) { return p.name; })) {
            names.push_back(property->name);
        } else if (auto navigation_property = matcher.BestMatch(navigation_properties, field.first,
                                                                [](const NavigationProperty &p) { return p.name; })) {
            names.push_back(navigation_property->name);
        } else {
            names.push_back(field.first);
        }
    }
    return names;
}

} // namespace odata_writer
