#pragma once

#include <string>
#include <utility>
#include <vector>

namespace feishu_auth {

/**
 * Error Context Helper
 *
 * Ordered key/value context attached to log events and error messages.
 * Keys keep their insertion order; setting an existing key replaces its value
 * in place.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("phase", "callback")
 *      .Set("variant", "miniapp");
 *   auto msg = ctx.Format("Signature mismatch");
 *   // Returns: "Signature mismatch [phase: callback, variant: miniapp]"
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable
     *
     * @param key The context key
     * @param value The context value
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);

    /**
     * Get a context variable
     *
     * @return The context value, or empty string if not set
     */
    std::string Get(const std::string& key) const;

    bool Has(const std::string& key) const;

    /**
     * Build a formatted message with context appended in insertion order
     */
    std::string Format(const std::string& base_message) const;

    const std::vector<std::pair<std::string, std::string>>& Entries() const { return context_; }

    void Clear();
    bool IsEmpty() const;

private:
    std::vector<std::pair<std::string, std::string>> context_;
};

// Shortens a secret for display: keeps the first characters and masks the rest
std::string RedactSecret(const std::string& secret, size_t visible = 6);

} // namespace feishu_auth
