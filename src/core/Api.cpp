#include "Api.hpp"

#include "../debug/log.hpp"
#include "../helpers/UrlUtils.hpp"

#include <set>

#include <fmt/format.h>
#include <glaze/glaze.hpp>

constexpr const char* IMAGES_PREFIX = "/images/";
constexpr size_t      ID_LENGTH     = 32;

//

template <typename T>
static std::string toJson(const T& obj) {
    return glz::write_json(obj).value_or("{}");
}

// client supplied, never log it raw
static std::string idForLog(const std::string& id) {
    return NApi::isWellFormedId(id) ? id : std::string{"<malformed id>"};
}

std::string NApi::imageUrl(const std::string& category, const std::string& image) {
    return fmt::format("{}{}/{}", IMAGES_PREFIX, NUrlUtils::encodePathSegment(category), NUrlUtils::encodePathSegment(image));
}

bool NApi::isWellFormedId(const std::string& id) {
    if (id.size() != ID_LENGTH)
        return false;

    for (const auto& c : id) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }

    return true;
}

NApi::SResponse NApi::issue(CCaptchaService& service, const CategoryCatalog& catalog) {
    const auto CAPTCHA = service.issue(catalog, imageUrl);

    if (!CAPTCHA.has_value())
        return {.code = 500, .body = toJson(SErrorJSON{.error = errorMessage(CAPTCHA.error())})};

    Debug::log(LOG, " | Issued captcha {}, {} pending", CAPTCHA->captcha_id, service.pending());

    return {.code = 200, .body = toJson(CAPTCHA.value())};
}

NApi::SResponse NApi::verify(CCaptchaService& service, const std::string& body) {
    SVerifyRequestJSON request;

    if (const auto EC = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, body); EC) {
        Debug::log(TRACE, "NApi::verify: bad body: {}", glz::format_error(EC, body));
        return {.code = 400, .body = toJson(SVerifyFailureJSON{.error = "Bad request", .reason = "bad_request"})};
    }

    const std::set<std::string> SELECTED(request.selected_ids.begin(), request.selected_ids.end());

    const auto                  RESULT = service.verify(request.captcha_id, SELECTED, request.pow.nonce);

    if (RESULT.error != CAPTCHA_ERR_NONE) {
        Debug::log(LOG, " | Verify {}: FAIL ({})", idForLog(request.captcha_id), errorToString(RESULT.error));

        std::string message = errorMessage(RESULT.error);
        if (RESULT.error == CAPTCHA_ERR_SELECTION_COUNT)
            message = fmt::format("Must select exactly {} images, got {}.", RESULT.expectedCount, RESULT.submittedCount);

        return {.code = 400, .body = toJson(SVerifyFailureJSON{.error = message, .reason = errorToString(RESULT.error)})};
    }

    Debug::log(LOG, " | Verify {}: {}", idForLog(request.captcha_id), RESULT.success ? "PASS" : "WRONG ANSWER");

    return {.code = 200, .body = toJson(SVerifyResponseJSON{.success = RESULT.success})};
}

NApi::SResponse NApi::check(const CCaptchaService& service, const std::string& body) {
    SCheckRequestJSON request;

    if (const auto EC = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, body); EC)
        return {.code = 400, .body = toJson(SCheckInvalidJSON{.error = "Bad request"})};

    const auto STATUS = service.check(request.captcha_id);

    if (!STATUS)
        return {.code = 200, .body = toJson(SCheckInvalidJSON{.error = errorMessage(CAPTCHA_ERR_UNKNOWN_CHALLENGE)})};

    return {.code = 200, .body = toJson(SCheckResponseJSON{.select_count = STATUS->selectCount, .pow = STATUS->pow})};
}
