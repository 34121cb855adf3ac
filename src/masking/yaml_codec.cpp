#include "masking/yaml_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <unordered_set>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool looks_numeric(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) {
               return std::isdigit(c) != 0 || c == '-' || c == '+' || c == '.' ||
                      c == 'e' || c == 'E';
           });
}

void emit(YAML::Emitter& out, const DataValue& value) {
    switch (value.kind()) {
        case DataValue::Kind::kNull:
            out << YAML::Null;
            break;
        case DataValue::Kind::kBool:
            out << value.as_bool();
            break;
        case DataValue::Kind::kInteger:
            out << static_cast<long long>(value.as_integer());
            break;
        case DataValue::Kind::kReal:
            out << value.as_real();
            break;
        case DataValue::Kind::kString: {
            const std::string& text = value.as_string();
            if (!classify_plain_scalar(text).is_string()) {
                out << YAML::DoubleQuoted << text;
            } else {
                out << text;
            }
            break;
        }
        case DataValue::Kind::kMap:
            out << YAML::BeginMap;
            for (std::size_t i = 0; i < value.size(); ++i) {
                out << YAML::Key << value.keys()[i] << YAML::Value;
                emit(out, value.items()[i]);
            }
            out << YAML::EndMap;
            break;
        case DataValue::Kind::kList:
        case DataValue::Kind::kTuple:
            out << YAML::BeginSeq;
            for (const auto& item : value.items()) {
                emit(out, item);
            }
            out << YAML::EndSeq;
            break;
    }
}

}  // namespace

DataValue classify_plain_scalar(std::string_view text) {
    if (text.empty() || text == "~" || iequals(text, "null")) {
        return DataValue::null();
    }
    if (iequals(text, "true")) {
        return DataValue::boolean(true);
    }
    if (iequals(text, "false")) {
        return DataValue::boolean(false);
    }
    if (!looks_numeric(text)) {
        return DataValue::string(std::string(text));
    }

    const char* begin = text.data();
    const char* end   = text.data() + text.size();

    std::int64_t integer{0};
    auto [iptr, iec] = std::from_chars(begin, end, integer);
    if (iec == std::errc{} && iptr == end) {
        return DataValue::integer(integer);
    }

    // strtod 는 null 종료 문자열이 필요하다.
    const std::string owned(text);
    char*             parsed_end = nullptr;
    const double      real       = std::strtod(owned.c_str(), &parsed_end);
    if (parsed_end == owned.c_str() + owned.size()) {
        return DataValue::real(real);
    }

    return DataValue::string(owned);
}

std::expected<DataValue, std::string> from_yaml(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return DataValue::null();
    }

    if (node.IsScalar()) {
        // 따옴표 문자열은 tag 가 "!" 이다 (non-plain scalar).
        if (node.Tag() == "!") {
            return DataValue::string(node.Scalar());
        }
        return classify_plain_scalar(node.Scalar());
    }

    if (node.IsSequence()) {
        DataValue list = DataValue::list();
        for (const auto& item : node) {
            auto converted = from_yaml(item);
            if (!converted) {
                return std::unexpected(converted.error());
            }
            list.push_back(std::move(*converted));
        }
        return list;
    }

    if (node.IsMap()) {
        DataValue                       map = DataValue::map();
        std::unordered_set<std::string> seen;
        for (const auto& entry : node) {
            if (!entry.first.IsScalar()) {
                return std::unexpected(fmt::format(
                    "yaml_codec: unsupported non-scalar map key at line {}",
                    entry.first.Mark().line + 1));
            }
            auto converted = from_yaml(entry.second);
            if (!converted) {
                return std::unexpected(converted.error());
            }
            // 중복 키는 마지막 값이 이긴다 (첫 등장 위치 유지).
            const std::string& key = entry.first.Scalar();
            if (seen.insert(key).second) {
                map.append_unique(key, std::move(*converted));
            } else {
                map.set(key, std::move(*converted));
            }
        }
        return map;
    }

    return std::unexpected(std::string("yaml_codec: undefined YAML node"));
}

std::expected<DataValue, std::string> parse_yaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format("yaml_codec: parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("yaml_codec: YAML error: {}", e.what()));
    }
    return from_yaml(root);
}

std::expected<std::string, std::string> to_yaml(const DataValue& value) {
    YAML::Emitter out;
    emit(out, value);
    if (!out.good()) {
        const std::string err = fmt::format("yaml_codec: emit failed: {}", out.GetLastError());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return std::string(out.c_str());
}
