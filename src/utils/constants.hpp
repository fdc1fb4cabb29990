
#ifndef CLUMP_CONSTANTS_HPP
#define CLUMP_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long DEFAULT_FAILURE_STATUS = 0;
    inline constexpr long MIN_HTTP_STATUS = 100;
    inline constexpr long MAX_HTTP_STATUS = 599;
    inline constexpr const char* TEXT_BODY_KEY = "text";
    inline constexpr const char* JSON_MEDIA_TYPE = "application/json";
    inline constexpr const char* JSON_SUFFIX = "+json";
    inline constexpr const char* LOGGER_NAME = "clump";

}  // namespace constants

#endif
