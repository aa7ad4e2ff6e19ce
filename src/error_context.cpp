#include "error_context.hpp"
#include <algorithm>
#include <sstream>

namespace odata_writer {

ErrorContext& ErrorContext::Set(const std::string& key, const std::string& value) {
    auto it = std::find_if(context_.begin(), context_.end(),
                           [&key](const std::pair<std::string, std::string>& entry) { return entry.first == key; });
    if (it != context_.end()) {
        it->second = value;
    } else {
        context_.emplace_back(key, value);
    }
    return *this;
}

ErrorContext& ErrorContext::Set(const std::string& key, int64_t value) {
    return Set(key, std::to_string(value));
}

std::string ErrorContext::Get(const std::string& key) const {
    for (const auto& [k, v] : context_) {
        if (k == key) {
            return v;
        }
    }
    return "";
}

std::string ErrorContext::Format(const std::string& base_message) const {
    if (context_.empty()) {
        return base_message;
    }

    std::ostringstream result;
    result << base_message << " [";

    bool first = true;
    for (const auto& [key, value] : context_) {
        if (!first) {
            result << ", ";
        }
        result << key << ": " << value;
        first = false;
    }

    result << "]";
    return result.str();
}

void ErrorContext::Clear() {
    context_.clear();
}

bool ErrorContext::IsEmpty() const {
    return context_.empty();
}

ScopedErrorContext::~ScopedErrorContext() {
    Clear();
}

} // namespace odata_writer
