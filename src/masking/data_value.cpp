#include "masking/data_value.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

DataValue DataValue::null() {
    return DataValue{};
}

DataValue DataValue::boolean(bool value) {
    DataValue v;
    v.kind_ = Kind::kBool;
    v.bool_ = value;
    return v;
}

DataValue DataValue::integer(std::int64_t value) {
    DataValue v;
    v.kind_    = Kind::kInteger;
    v.integer_ = value;
    return v;
}

DataValue DataValue::real(double value) {
    DataValue v;
    v.kind_ = Kind::kReal;
    v.real_ = value;
    return v;
}

DataValue DataValue::string(std::string value) {
    DataValue v;
    v.kind_   = Kind::kString;
    v.string_ = std::move(value);
    return v;
}

DataValue DataValue::map() {
    DataValue v;
    v.kind_ = Kind::kMap;
    return v;
}

DataValue DataValue::list(std::vector<DataValue> items) {
    DataValue v;
    v.kind_  = Kind::kList;
    v.items_ = std::move(items);
    return v;
}

DataValue DataValue::tuple(std::vector<DataValue> items) {
    DataValue v;
    v.kind_  = Kind::kTuple;
    v.items_ = std::move(items);
    return v;
}

bool DataValue::as_bool() const {
    require(Kind::kBool, "as_bool");
    return bool_;
}

std::int64_t DataValue::as_integer() const {
    require(Kind::kInteger, "as_integer");
    return integer_;
}

double DataValue::as_real() const {
    require(Kind::kReal, "as_real");
    return real_;
}

const std::string& DataValue::as_string() const {
    require(Kind::kString, "as_string");
    return string_;
}

void DataValue::set(std::string key, DataValue value) {
    require(Kind::kMap, "set");
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            items_[i] = std::move(value);
            return;
        }
    }
    keys_.push_back(std::move(key));
    items_.push_back(std::move(value));
}

void DataValue::append_unique(std::string key, DataValue value) {
    require(Kind::kMap, "append_unique");
    keys_.push_back(std::move(key));
    items_.push_back(std::move(value));
}

const DataValue* DataValue::find(std::string_view key) const {
    if (kind_ != Kind::kMap) {
        return nullptr;
    }
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &items_[i];
        }
    }
    return nullptr;
}

void DataValue::push_back(DataValue value) {
    if (!is_sequence()) {
        throw std::logic_error(
            fmt::format("DataValue::push_back on {} value", data_kind_name(kind_)));
    }
    items_.push_back(std::move(value));
}

bool DataValue::operator==(const DataValue& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::kNull:    return true;
        case Kind::kBool:    return bool_ == other.bool_;
        case Kind::kInteger: return integer_ == other.integer_;
        case Kind::kReal:    return real_ == other.real_;
        case Kind::kString:  return string_ == other.string_;
        case Kind::kMap:     return keys_ == other.keys_ && items_ == other.items_;
        case Kind::kList:
        case Kind::kTuple:   return items_ == other.items_;
    }
    return false;
}

void DataValue::require(Kind expected, std::string_view operation) const {
    if (kind_ != expected) {
        throw std::logic_error(fmt::format("DataValue::{} on {} value (expected {})",
                                           operation, data_kind_name(kind_),
                                           data_kind_name(expected)));
    }
}

std::string_view data_kind_name(DataValue::Kind kind) noexcept {
    switch (kind) {
        case DataValue::Kind::kNull:    return "null";
        case DataValue::Kind::kBool:    return "bool";
        case DataValue::Kind::kInteger: return "integer";
        case DataValue::Kind::kReal:    return "real";
        case DataValue::Kind::kString:  return "string";
        case DataValue::Kind::kMap:     return "map";
        case DataValue::Kind::kList:    return "list";
        case DataValue::Kind::kTuple:   return "tuple";
    }
    return "unknown";
}
