#pragma once

#include "duckdb.hpp"
#include "odata_entity_data.hpp"
#include "odata_request_message.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace odata_writer
{

/**
 * @brief Collects operations of one batch and frames them for transmission.
 *
 * Content ids are allocated monotonically from 1 and mapped to entity data by
 * object identity, so a later operation in the same batch can link to an entity
 * that has no key yet ($<content id>). The writer shares ownership of every
 * mapped entity, so an address stays taken for the lifetime of the batch.
 */
class ODataBatchWriter
{
public:
    virtual ~ODataBatchWriter() = default;

    virtual void StartBatch() = 0;
    // The returned message stays owned by the writer until EndBatch
    virtual ODataRequestMessage &CreateOperationRequestMessage(HttpMethod method, const std::string &url) = 0;
    // Returns the framed batch body; the writer accepts no operations afterwards
    virtual std::string EndBatch() = 0;
    virtual std::string ContentType() const = 0;

    int64_t NextContentId();
    void MapContentId(EntityDataPtr data, int64_t content_id);
    std::optional<int64_t> GetContentId(const EntityData &data) const;

private:
    mutable std::mutex content_id_mutex;
    int64_t last_content_id = 0;
    std::unordered_map<const EntityData *, std::pair<EntityDataPtr, int64_t>> content_ids;
};

// ----------------------------------------------------------------------

// multipart/mixed batch with all operations in a single change set
class ODataMultipartBatchWriter : public ODataBatchWriter
{
public:
    // Empty boundaries are replaced with random ones
    explicit ODataMultipartBatchWriter(std::string service_root = "", std::string batch_boundary = "",
                                       std::string changeset_boundary = "");

    void StartBatch() override;
    ODataRequestMessage &CreateOperationRequestMessage(HttpMethod method, const std::string &url) override;
    std::string EndBatch() override;
    std::string ContentType() const override;

    const std::vector<std::unique_ptr<ODataRequestMessage>> &Operations() const { return operations; }
    const std::string &BatchBoundary() const { return batch_boundary; }
    const std::string &ChangesetBoundary() const { return changeset_boundary; }

private:
    std::string OperationUrl(const std::string &url) const;

    std::string service_root;
    std::string batch_boundary;
    std::string changeset_boundary;
    bool started = false;
    bool ended = false;
    std::vector<std::unique_ptr<ODataRequestMessage>> operations;
};

// ----------------------------------------------------------------------

// Creates and starts its batch writer on first use, exactly once
class DeferredBatchWriter
{
public:
    using Factory = std::function<std::unique_ptr<ODataBatchWriter>()>;

    explicit DeferredBatchWriter(Factory factory);

    // Concurrent first callers block until the one performing the start returns
    ODataBatchWriter &GetStartedWriter();
    bool IsStarted() const { return started.load(); }

    // Held while an operation is created and its content id allocated
    std::mutex &OperationLock() { return operation_lock; }

    std::string EndBatch();
    std::string ContentType();

private:
    Factory factory;
    std::once_flag start_flag;
    std::unique_ptr<ODataBatchWriter> writer;
    std::atomic<bool> started { false };
    std::mutex operation_lock;
};

} // namespace odata_writer
