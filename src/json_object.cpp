#include "json_object.hpp"

#include <cstdlib>
#include <stdexcept>

namespace feishu_auth {

namespace {

std::shared_ptr<yyjson_mut_doc> NewObjectDocument() {
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!doc) {
        throw std::bad_alloc();
    }
    yyjson_mut_doc_set_root(doc.get(), yyjson_mut_obj(doc.get()));
    return doc;
}

std::string WriteValue(const yyjson_mut_val* value) {
    size_t len = 0;
    char* json = yyjson_mut_val_write(value, YYJSON_WRITE_NOFLAG, &len);
    if (!json) {
        return "";
    }
    std::string result(json, len);
    free(json);
    return result;
}

} // anonymous namespace

JsonObject::JsonObject() : doc_(NewObjectDocument()) {
}

JsonObject::JsonObject(std::shared_ptr<yyjson_mut_doc> doc) : doc_(std::move(doc)) {
}

JsonObject::JsonObject(const JsonObject& other) : doc_(NewObjectDocument()) {
    auto other_root = other.Root();
    if (other_root) {
        yyjson_mut_doc_set_root(doc_.get(), yyjson_mut_val_mut_copy(doc_.get(), other_root));
    }
}

JsonObject& JsonObject::operator=(const JsonObject& other) {
    if (this != &other) {
        JsonObject copy(other);
        doc_ = std::move(copy.doc_);
    }
    return *this;
}

JsonObject JsonObject::Parse(const std::string& json) {
    auto parsed = TryParse(json);
    if (!parsed) {
        throw std::invalid_argument("Content is not a JSON object");
    }
    return std::move(*parsed);
}

std::optional<JsonObject> JsonObject::TryParse(const std::string& json) {
    if (json.empty()) {
        return std::nullopt;
    }

    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(json.c_str(), json.size(), YYJSON_READ_NOFLAG), yyjson_doc_free);
    if (!doc) {
        return std::nullopt;
    }

    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        return std::nullopt;
    }

    auto mut_doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!mut_doc) {
        throw std::bad_alloc();
    }
    yyjson_mut_doc_set_root(mut_doc.get(), yyjson_val_mut_copy(mut_doc.get(), root));
    return JsonObject(std::move(mut_doc));
}

yyjson_mut_val* JsonObject::Root() const {
    if (!doc_) {
        return nullptr;
    }
    return yyjson_mut_doc_get_root(doc_.get());
}

yyjson_mut_val* JsonObject::Lookup(const std::string& key) const {
    auto root = Root();
    if (!root) {
        return nullptr;
    }
    return yyjson_mut_obj_getn(root, key.c_str(), key.size());
}

bool JsonObject::Has(const std::string& key) const {
    return Lookup(key) != nullptr;
}

bool JsonObject::IsNull(const std::string& key) const {
    auto value = Lookup(key);
    return value && yyjson_mut_is_null(value);
}

size_t JsonObject::Size() const {
    auto root = Root();
    return root ? yyjson_mut_obj_size(root) : 0;
}

std::vector<std::string> JsonObject::Keys() const {
    std::vector<std::string> keys;
    auto root = Root();
    if (!root) {
        return keys;
    }

    keys.reserve(yyjson_mut_obj_size(root));
    yyjson_mut_obj_iter iter;
    yyjson_mut_obj_iter_init(root, &iter);
    yyjson_mut_val* key;
    while ((key = yyjson_mut_obj_iter_next(&iter))) {
        keys.emplace_back(yyjson_mut_get_str(key), yyjson_mut_get_len(key));
    }
    return keys;
}

std::optional<std::string> JsonObject::GetString(const std::string& key) const {
    auto value = Lookup(key);
    if (!value || !yyjson_mut_is_str(value)) {
        return std::nullopt;
    }
    return std::string(yyjson_mut_get_str(value), yyjson_mut_get_len(value));
}

std::optional<std::string> JsonObject::GetScalarAsString(const std::string& key) const {
    auto value = Lookup(key);
    if (!value) {
        return std::nullopt;
    }
    if (yyjson_mut_is_str(value)) {
        return std::string(yyjson_mut_get_str(value), yyjson_mut_get_len(value));
    }
    if (yyjson_mut_is_uint(value)) {
        return std::to_string(yyjson_mut_get_uint(value));
    }
    if (yyjson_mut_is_sint(value)) {
        return std::to_string(yyjson_mut_get_sint(value));
    }
    if (yyjson_mut_is_real(value) || yyjson_mut_is_bool(value)) {
        return WriteValue(value);
    }
    return std::nullopt;
}

std::optional<int64_t> JsonObject::GetInt(const std::string& key) const {
    auto value = Lookup(key);
    if (!value) {
        return std::nullopt;
    }
    if (yyjson_mut_is_int(value)) {
        return yyjson_mut_get_sint(value);
    }
    if (yyjson_mut_is_str(value)) {
        try {
            size_t consumed = 0;
            std::string text(yyjson_mut_get_str(value), yyjson_mut_get_len(value));
            auto parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<JsonObject> JsonObject::GetObject(const std::string& key) const {
    auto value = Lookup(key);
    if (!value || !yyjson_mut_is_obj(value)) {
        return std::nullopt;
    }

    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    if (!doc) {
        throw std::bad_alloc();
    }
    yyjson_mut_doc_set_root(doc.get(), yyjson_mut_val_mut_copy(doc.get(), value));
    return JsonObject(std::move(doc));
}

void JsonObject::Put(const std::string& key, yyjson_mut_val* value) {
    auto root = Root();
    auto key_val = yyjson_mut_strncpy(doc_.get(), key.c_str(), key.size());
    if (!key_val || !value || !yyjson_mut_obj_put(root, key_val, value)) {
        throw std::runtime_error("Failed to store JSON value for key '" + key + "'");
    }
}

void JsonObject::SetString(const std::string& key, const std::string& value) {
    if (!doc_) {
        doc_ = NewObjectDocument();
    }
    Put(key, yyjson_mut_strncpy(doc_.get(), value.c_str(), value.size()));
}

void JsonObject::SetInt(const std::string& key, int64_t value) {
    if (!doc_) {
        doc_ = NewObjectDocument();
    }
    Put(key, yyjson_mut_sint(doc_.get(), value));
}

void JsonObject::SetNull(const std::string& key) {
    if (!doc_) {
        doc_ = NewObjectDocument();
    }
    Put(key, yyjson_mut_null(doc_.get()));
}

void JsonObject::SetObject(const std::string& key, const JsonObject& value) {
    if (!doc_) {
        doc_ = NewObjectDocument();
    }
    auto value_root = value.Root();
    Put(key, value_root ? yyjson_mut_val_mut_copy(doc_.get(), value_root) : yyjson_mut_obj(doc_.get()));
}

void JsonObject::SetValueFrom(const std::string& key, const JsonObject& source, const std::string& source_key) {
    auto source_value = source.Lookup(source_key);
    if (!source_value) {
        return;
    }
    if (!doc_) {
        doc_ = NewObjectDocument();
    }
    Put(key, yyjson_mut_val_mut_copy(doc_.get(), source_value));
}

void JsonObject::MergeMissing(const JsonObject& fallback) {
    for (const auto& key : fallback.Keys()) {
        if (!Has(key)) {
            SetValueFrom(key, fallback, key);
        }
    }
}

std::string JsonObject::ToJson() const {
    auto root = Root();
    if (!root) {
        return "{}";
    }
    return WriteValue(root);
}

} // namespace feishu_auth
