#include <iostream>
#include <filesystem>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>

#include "debug/log.hpp"

#include "core/Handler.hpp"
#include "core/CaptchaService.hpp"
#include "core/Reaper.hpp"

#include "config/Config.hpp"
#include "helpers/FsUtils.hpp"

#include "GlobalState.hpp"

#include <signal.h>

int main(int argc, char** argv, char** envp) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    g_pGlobalState->cwd = std::filesystem::current_path();

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h") {
            std::cout << "capgrid " << CAPGRID_VERSION << "\n-c [config.jsonc]\n";
            return 0;
        } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
            g_pGlobalState->configPath = ARGS[i + 1];
            i++;
        } else {
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
            continue;
        }
    }

    g_pConfig = std::make_unique<CConfig>(NFsUtils::absolutePath(g_pGlobalState->configPath));

    if (!std::filesystem::is_directory(NFsUtils::imagesRoot()))
        Debug::log(WARN, "images_dir {} does not exist, every captcha request will fail", NFsUtils::imagesRoot());

    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0)
        return 1;

    auto service = std::make_shared<CCaptchaService>(g_pConfig->captchaSettings());
    auto reaper  = std::make_unique<CStoreReaper>(service->store(), std::chrono::seconds(g_pConfig->m_config.reap_interval_seconds));

    Pistache::Address address = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "Starting capgrid {} on {}:{}, pow difficulty {}, ttl {}s", CAPGRID_VERSION, address.host(), address.port().toString(),
               g_pConfig->m_config.pow_difficulty, g_pConfig->m_config.pow_ttl_seconds);

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options().threads(g_pConfig->m_config.threads).flags(Pistache::Tcp::Options::ReuseAddr);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    endpoint->setHandler(Pistache::Http::make_handler<CServerHandler>(service));

    endpoint->serveThreaded();

    bool terminate = false;
    while (!terminate) {
        int number = 0;
        int status = sigwait(&signals, &number);
        if (status != 0) {
            Debug::log(CRIT, "sigwait threw {} :(", status);
            break;
        }

        Debug::log(LOG, "Caught signal {}", number);

        switch (number) {
            case SIGINT: terminate = true; break;
            case SIGTERM: terminate = true; break;
            case SIGQUIT: terminate = true; break;
            case SIGPIPE: break;
            case SIGALRM: break;
        }
    }

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, {} challenges still pending, bye!", service->pending());

    endpoint->shutdown();
    endpoint = nullptr;

    reaper->stop();
    reaper = nullptr;

    return 0;
}
