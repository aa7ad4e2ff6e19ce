#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <utility>

namespace odata_writer {

/**
 * Error Context Helper
 *
 * Collects key/value context while an entry is being encoded so that a
 * failure can report where it happened.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("entity_type", "Sales.Order")
 *      .Set("property", "Total");
 *   throw ODataFormatException(ctx.Format("Unable to convert value"));
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable. Re-setting a key replaces its value but keeps
     * its original position.
     *
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);
    ErrorContext& Set(const std::string& key, int64_t value);

    /**
     * @return The context value, or empty string if not set
     */
    std::string Get(const std::string& key) const;

    /**
     * Build a formatted error message with context, in insertion order.
     *
     * Example:
     *   ctx.Set("entity_set", "Orders").Set("method", "PATCH");
     *   ctx.Format("Write failed");
     *   // Returns: "Write failed [entity_set: Orders, method: PATCH]"
     */
    std::string Format(const std::string& base_message) const;

    void Clear();
    bool IsEmpty() const;

private:
    std::vector<std::pair<std::string, std::string>> context_;
};

/**
 * Scoped Error Context
 *
 * Clears its context when the scope exits.
 */
class ScopedErrorContext : public ErrorContext {
public:
    ScopedErrorContext() = default;
    ~ScopedErrorContext();

    ScopedErrorContext(const ScopedErrorContext&) = delete;
    ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;

    ScopedErrorContext(ScopedErrorContext&&) = default;
    ScopedErrorContext& operator=(ScopedErrorContext&&) = default;
};

} // namespace odata_writer
