#pragma once

#include <string>
#include <vector>

#include "CaptchaService.hpp"

/*
    JSON bodies of /api/captcha, /api/verify and /api/check, kept apart from
    the http layer so the wire contract can be exercised without an endpoint.
*/
namespace NApi {
    struct SPowNonceJSON {
        std::string nonce;
    };

    struct SVerifyRequestJSON {
        std::string              captcha_id;
        std::vector<std::string> selected_ids;
        SPowNonceJSON            pow;
    };

    struct SCheckRequestJSON {
        std::string captcha_id;
    };

    struct SErrorJSON {
        std::string error;
    };

    struct SVerifyResponseJSON {
        bool success = false;
    };

    struct SVerifyFailureJSON {
        bool        success = false;
        std::string error;
        std::string reason;
    };

    struct SCheckResponseJSON {
        bool      valid        = true;
        size_t    select_count = 0;
        SPowBlock pow;
    };

    struct SCheckInvalidJSON {
        bool        valid = false;
        std::string error;
    };

    struct SResponse {
        int         code = 200;
        std::string body;
    };

    std::string imageUrl(const std::string& category, const std::string& image);

    // ids this server hands out are 16 random bytes in lowercase hex
    bool        isWellFormedId(const std::string& id);

    SResponse   issue(CCaptchaService& service, const CategoryCatalog& catalog);
    SResponse   verify(CCaptchaService& service, const std::string& body);
    SResponse   check(const CCaptchaService& service, const std::string& body);
};
