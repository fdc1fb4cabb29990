#include "body_decoder.hpp"

#include <simdjson.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

using namespace simdjson;

namespace http::decoder {
    using http::model::StructuredMap;

    namespace {
        std::string_view media_type(std::string_view content_type) {
            const auto semicolon = content_type.find(';');
            return semicolon == std::string_view::npos ? content_type : content_type.substr(0, semicolon);
        }

        [[noreturn]] void throw_decode_error(const http::model::Response& resp, const std::string& msg) {
            throw http::http_error::DecodeError(resp.status_, resp.effective_url_, http::http_error::body_preview(resp.body_), msg);
        }
    }  // namespace

    bool BodyDecoder::is_json_content_type(std::string_view content_type) {
        const std::string media = string_utils::to_lower(string_utils::trim(std::string(media_type(content_type))));
        if (media == constants::JSON_MEDIA_TYPE) {
            return true;
        }

        const std::string_view suffix = constants::JSON_SUFFIX;
        return media.size() > suffix.size() && media.compare(media.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    StructuredMap BodyDecoder::text_body(const std::string& raw) { return StructuredMap{{constants::TEXT_BODY_KEY, raw}}; }

    std::optional<StructuredMap> BodyDecoder::parse_json(const http::model::Response& resp) {
        if (!is_json_content_type(resp.content_type_)) {
            const std::string shown = resp.content_type_.empty() ? "<none>" : resp.content_type_;
            throw_decode_error(resp, "Attempt to decode JSON with unexpected mimetype: " + shown);
        }

        if (string_utils::trim(resp.body_).empty()) {
            return std::nullopt;
        }

        try {
            dom::parser parser;
            dom::element doc = parser.parse(resp.body_);
            return to_structured(doc);
        } catch (const simdjson::simdjson_error& e) {
            throw_decode_error(resp, "Failed to parse JSON response: " + std::string(e.what()));
        }
    }

    StructuredMap BodyDecoder::to_structured(dom::element element) {
        switch (element.type()) {
            case dom::element_type::ARRAY: {
                StructuredMap out = StructuredMap::array();
                for (dom::element child : dom::array(element)) {
                    out.push_back(to_structured(child));
                }
                return out;
            }
            case dom::element_type::OBJECT: {
                StructuredMap out = StructuredMap::object();
                for (dom::key_value_pair field : dom::object(element)) {
                    out[std::string(field.key)] = to_structured(field.value);
                }
                return out;
            }
            case dom::element_type::INT64:
                return int64_t(element);
            case dom::element_type::UINT64:
                return uint64_t(element);
            case dom::element_type::DOUBLE:
                return double(element);
            case dom::element_type::STRING:
                return std::string(std::string_view(element));
            case dom::element_type::BOOL:
                return bool(element);
            case dom::element_type::NULL_VALUE:
                return nullptr;
        }
        return nullptr;
    }

    DecodeResult BodyDecoder::decode(const http::model::Response& resp) const {
        try {
            return DecodeResult{.body_ = parse_json(resp), .error_ = std::nullopt};
        } catch (const http::http_error::DecodeError& e) {
            logging::logger()->error("Failed to decode JSON response from {}: {}", resp.effective_url_, e.what());
            http::model::FailureRecord error = http::model::FailureRecord::from_current_exception(http::model::ErrorKind::DECODE);

            logging::logger()->trace("Attempting to read response as text");
            StructuredMap body = text_body(resp.body_);
            logging::logger()->trace("Successfully read response as text");

            return DecodeResult{.body_ = std::move(body), .error_ = std::move(error)};
        }
    }
}  // namespace http::decoder
