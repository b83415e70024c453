#include "Handler.hpp"
#include "Api.hpp"
#include "Catalog.hpp"
#include "../debug/log.hpp"
#include "../config/Config.hpp"
#include "../helpers/FsUtils.hpp"
#include "../helpers/UrlUtils.hpp"

#include <tinylates/tinylates.hpp>
#include <magic.h>

constexpr const char* IMAGES_PREFIX = "/images/";
constexpr const char* STATIC_PREFIX = "/static/";

//

static void sendJson(Pistache::Http::ResponseWriter& response, const NApi::SResponse& resp) {
    response.send(static_cast<Pistache::Http::Code>(resp.code), resp.body, MIME(Application, Json));
}

CServerHandler::CServerHandler(std::shared_ptr<CCaptchaService> service) : m_service(service) {
    ;
}

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    const auto RES = req.resource();

    Debug::log(LOG, "New request: {} {} from {}", Pistache::Http::methodString(req.method()), RES, req.address().host());

    try {
        if (RES == "/api/captcha") {
            if (req.method() == Pistache::Http::Method::Get)
                issueCaptcha(req, response);
            else
                response.send(Pistache::Http::Code::Method_Not_Allowed, "Method Not Allowed");
            return;
        }

        if (RES == "/api/verify") {
            if (req.method() == Pistache::Http::Method::Post)
                verifyCaptcha(req, response);
            else
                response.send(Pistache::Http::Code::Method_Not_Allowed, "Method Not Allowed");
            return;
        }

        if (RES == "/api/check") {
            if (req.method() == Pistache::Http::Method::Post)
                checkCaptcha(req, response);
            else
                response.send(Pistache::Http::Code::Method_Not_Allowed, "Method Not Allowed");
            return;
        }

        if (req.method() != Pistache::Http::Method::Get) {
            response.send(Pistache::Http::Code::Method_Not_Allowed, "Method Not Allowed");
            return;
        }

        if (RES == "/" || RES == "/index.html") {
            serveIndex(req, response);
            return;
        }

        if (RES.starts_with(IMAGES_PREFIX)) {
            serveFile(NFsUtils::imagesRoot(), RES.substr(std::string_view{IMAGES_PREFIX}.size()), response);
            return;
        }

        if (RES.starts_with(STATIC_PREFIX)) {
            serveFile(NFsUtils::htmlPath(""), RES.substr(std::string_view{STATIC_PREFIX}.size()), response);
            return;
        }

        response.send(Pistache::Http::Code::Not_Found, "Not Found");
    } catch (std::exception& e) {
        Debug::log(ERR, "Request {} failed: {}", RES, e.what());
        response.send(Pistache::Http::Code::Internal_Server_Error, "Internal Server Error");
    }
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, PrintException());
}

void CServerHandler::serveIndex(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    const auto PAGE_INDEX = NFsUtils::readFileAsString(NFsUtils::htmlPath("index.html"));

    if (!PAGE_INDEX.has_value()) {
        Debug::log(ERR, "No index.html in {}", NFsUtils::htmlPath(""));
        response.send(Pistache::Http::Code::Not_Found, "Not Found");
        return;
    }

    CTinylates page(PAGE_INDEX.value());
    page.setTemplateRoot(NFsUtils::htmlPath(""));

    page.add("powDifficulty", CTinylatesProp(std::to_string(m_service->settings().powDifficulty)));
    page.add("powTtl", CTinylatesProp(std::to_string(m_service->settings().powTtl.count())));
    page.add("capgridVersion", CTinylatesProp(CAPGRID_VERSION));

    response.setMime(Pistache::Http::Mime::MediaType::fromString("text/html"));
    response.send(Pistache::Http::Code::Ok, page.render().value_or("error"));
}

void CServerHandler::serveFile(const std::string& root, const std::string& resource, Pistache::Http::ResponseWriter& response) {
    // pistache hands over the resource still percent-encoded
    const auto DECODED = NUrlUtils::decodePath(resource);

    if (!DECODED.has_value()) {
        Debug::log(TRACE, "serveFile: {} rejected: {}", resource, DECODED.error());
        response.send(Pistache::Http::Code::Bad_Request, "Bad Request");
        return;
    }

    // traversal is checked on the decoded path, %2e%2e included
    const auto PATH = NFsUtils::resolveUnder(root, DECODED.value());

    if (!PATH.has_value()) {
        Debug::log(TRACE, "serveFile: {} rejected: {}", resource, PATH.error());
        response.send(Pistache::Http::Code::Not_Found, "Not Found");
        return;
    }

    // attempt to handle mime
    magic_t magic = magic_open(MAGIC_MIME_TYPE);
    if (magic && magic_load(magic, nullptr) == 0) {
        const char* m        = magic_file(magic, PATH->c_str());
        auto        mimeType = Pistache::Http::Mime::MediaType::fromString(m ? std::string(m) : std::string("application/octet-stream"));
        response.headers().add<Pistache::Http::Header::ContentType>(mimeType);
    }
    if (magic)
        magic_close(magic);

    const auto BODY = NFsUtils::readFileAsString(PATH.value());
    if (!BODY.has_value()) {
        response.send(Pistache::Http::Code::Internal_Server_Error, "Internal Server Error");
        return;
    }

    response.send(Pistache::Http::Code::Ok, BODY.value());
}

void CServerHandler::issueCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    // fresh snapshot every time, categories may change on disk
    const auto CATALOG = NCatalog::discover(NFsUtils::imagesRoot(), *g_pConfig->m_parsedConfigDatas.imagePattern);

    sendJson(response, NApi::issue(*m_service, CATALOG));
}

void CServerHandler::verifyCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    sendJson(response, NApi::verify(*m_service, req.body()));
}

void CServerHandler::checkCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    sendJson(response, NApi::check(*m_service, req.body()));
}
