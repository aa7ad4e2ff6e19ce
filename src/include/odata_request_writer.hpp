#pragma once

#include "odata_batch_writer.hpp"
#include "odata_entity_data.hpp"
#include "odata_entry_encoder.hpp"
#include "odata_metadata.hpp"
#include "odata_payload_writer.hpp"
#include "odata_request_message.hpp"
#include "odata_writer_settings.hpp"

#include <memory>
#include <optional>
#include <string>

namespace odata_writer
{

/**
 * @brief Writes entity and link request bodies for one service.
 *
 * Without a batch every write produces its own message. With a batch, writes
 * become operations of that batch: the batch is started on the first write,
 * non-delete operations get a Content-ID so later operations can link to them,
 * and the body goes into the operation instead of back to the caller.
 * Batched writes take an EntityDataPtr; the batch keeps it alive so links to
 * it resolve by identity until the batch ends.
 *
 * Usage:
 *   auto metadata = ODataMetadata::FromXml(metadata_xml);
 *   ODataRequestWriter writer(ODataWriterSettings(), metadata);
 *   auto body = writer.WriteEntryContent(HttpMethod::PATCH, "Orders", EntityData({{"Total", Value("12.50")}}), "Orders(1)");
 *
 *   ODataRequestWriter batched(ODataWriterSettings(), metadata, batch);
 *   auto order = EntityData::Create({{"Id", Value::INTEGER(1)}});
 *   batched.WriteEntryContent(HttpMethod::POST, "Orders", order, "Orders");
 */
class ODataRequestWriter
{
public:
    ODataRequestWriter(ODataWriterSettings settings, std::shared_ptr<const ODataMetadata> metadata,
                       std::shared_ptr<DeferredBatchWriter> batch = nullptr);

    // Body of a standalone write, or std::nullopt for DELETE. Throws when a batch is configured.
    std::optional<std::string> WriteEntryContent(HttpMethod method, const std::string &collection,
                                                 const EntityData &data, const std::string &command_text);
    // As above, or std::nullopt for every batched write
    std::optional<std::string> WriteEntryContent(HttpMethod method, const std::string &collection,
                                                 EntityDataPtr data, const std::string &command_text);

    // Standalone message with headers and body; throws when a batch is configured
    ODataRequestMessage WriteEntryRequest(HttpMethod method, const std::string &collection,
                                          const EntityData &data, const std::string &command_text) const;

    // Entity reference link document for $ref / $links requests
    std::string WriteLinkContent(const std::string &link_path) const;

    std::string ContentType() const;
    std::string LinkContentType() const;

    bool IsBatch() const { return batch != nullptr; }
    const ODataWriterSettings &Settings() const { return settings; }

private:
    std::string EncodeBody(HttpMethod method, const EntitySet &entity_set, const EntityData &data,
                           const ODataBatchWriter *batch_writer) const;
    void ApplyHeaders(ODataRequestMessage &message, const EntitySet &entity_set) const;
    std::vector<std::string> DeclaredFieldNames(const EntityType &entity_type, const EntityData &data) const;

    ODataWriterSettings settings;
    std::shared_ptr<const ODataMetadata> metadata;
    std::shared_ptr<DeferredBatchWriter> batch;
    std::unique_ptr<ODataPayloadWriter> payload_writer;
};

} // namespace odata_writer
