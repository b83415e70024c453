#pragma once

#include <pistache/http.h>

#include <memory>
#include <string>

#include "CaptchaService.hpp"

class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

  public:
    CServerHandler(std::shared_ptr<CCaptchaService> service);

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

  private:
    void serveIndex(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);
    void serveFile(const std::string& root, const std::string& resource, Pistache::Http::ResponseWriter& response);
    void issueCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);
    void verifyCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);
    void checkCaptcha(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);

    std::shared_ptr<CCaptchaService> m_service;
};
