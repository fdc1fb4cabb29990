#ifndef CLUMP_BODY_DECODER_HPP
#define CLUMP_BODY_DECODER_HPP

#include <simdjson.h>

#include <optional>
#include <string>
#include <string_view>

#include "../model/model.hpp"
#include "../model/outcome.hpp"

namespace http::decoder {

    struct DecodeResult {
        std::optional<http::model::StructuredMap> body_;
        std::optional<http::model::FailureRecord> error_;  // set iff the text fallback was taken
    };

    // JSON decode with a text fallback: a body that is not JSON is returned as {"text": <raw>} and the
    // decode error is reported alongside instead of thrown.
    class BodyDecoder {
       public:
        [[nodiscard]] DecodeResult decode(const http::model::Response& resp) const;

        [[nodiscard]] static bool is_json_content_type(std::string_view content_type);
        [[nodiscard]] static http::model::StructuredMap text_body(const std::string& raw);

        // Throws http_error::DecodeError.
        [[nodiscard]] static std::optional<http::model::StructuredMap> parse_json(const http::model::Response& resp);

       private:
        static http::model::StructuredMap to_structured(simdjson::dom::element element);
    };
}  // namespace http::decoder

#endif
