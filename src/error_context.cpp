#include "error_context.hpp"
#include <algorithm>
#include <sstream>

namespace feishu_auth {

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

std::string ErrorContext::Get(const std::string& key) const {
    for (const auto& [k, v] : context_) {
        if (k == key) {
            return v;
        }
    }
    return "";
}

bool ErrorContext::Has(const std::string& key) const {
    return std::any_of(context_.begin(), context_.end(),
                       [&key](const std::pair<std::string, std::string>& entry) { return entry.first == key; });
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

std::string RedactSecret(const std::string& secret, size_t visible) {
    if (secret.empty()) {
        return "";
    }
    if (secret.length() <= visible) {
        return std::string(secret.length(), '*');
    }
    return secret.substr(0, visible) + "...";
}

} // namespace feishu_auth
