#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yyjson.h>

namespace feishu_auth {

// String-keyed JSON object backed by a mutable yyjson document. Copies are deep,
// so a copy handed out by a token or profile can never alias the original.
class JsonObject {
public:
    JsonObject();
    JsonObject(const JsonObject& other);
    JsonObject& operator=(const JsonObject& other);
    JsonObject(JsonObject&& other) noexcept = default;
    JsonObject& operator=(JsonObject&& other) noexcept = default;
    ~JsonObject() = default;

    // Throws std::invalid_argument when the text is not a JSON object
    static JsonObject Parse(const std::string& json);
    static std::optional<JsonObject> TryParse(const std::string& json);

    bool Has(const std::string& key) const;
    bool IsNull(const std::string& key) const;
    size_t Size() const;
    bool Empty() const { return Size() == 0; }
    std::vector<std::string> Keys() const;

    // Only string values; numbers, objects etc. yield nullopt
    std::optional<std::string> GetString(const std::string& key) const;
    // Strings, integers, reals and booleans rendered as text
    std::optional<std::string> GetScalarAsString(const std::string& key) const;
    std::optional<int64_t> GetInt(const std::string& key) const;
    std::optional<JsonObject> GetObject(const std::string& key) const;

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int64_t value);
    void SetNull(const std::string& key);
    void SetObject(const std::string& key, const JsonObject& value);
    // Deep-copies the value stored under source_key in source
    void SetValueFrom(const std::string& key, const JsonObject& source, const std::string& source_key);

    // Adds every key of fallback that this object does not already carry
    void MergeMissing(const JsonObject& fallback);

    std::string ToJson() const;

private:
    explicit JsonObject(std::shared_ptr<yyjson_mut_doc> doc);

    yyjson_mut_val* Root() const;
    yyjson_mut_val* Lookup(const std::string& key) const;
    void Put(const std::string& key, yyjson_mut_val* value);

    std::shared_ptr<yyjson_mut_doc> doc_;
};

} // namespace feishu_auth
