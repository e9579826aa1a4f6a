#include "session/SessionManager.h"
#include "utils/Logger.h"
#include <cstdio>
#include <random>
#include <vector>

SessionOptions SessionOptions::fromConfig(const Config& cfg) {
    SessionOptions o;
    o.queueCapacity = cfg.sse.maxQueueSize;
    o.idleTimeout = std::chrono::milliseconds(static_cast<long long>(cfg.performance.idleTimeout * 1000.0));
    o.core = CoreOptions::fromConfig(cfg);
    return o;
}

SessionManager::SessionManager(IToolCatalog& catalog, const ServerCapabilities& capabilities,
                               SessionOptions options)
    : catalog(catalog), capabilities(capabilities), options(options) {
    monitor = std::thread(&SessionManager::monitorLoop, this);
}

SessionManager::~SessionManager() {
    shutdown();
}

std::string SessionManager::generateSessionId() {
    // Session ids double as connection tokens on the network transport, so they must not be guessable.
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(rng()), static_cast<unsigned long long>(rng()));
    return buf;
}

std::shared_ptr<Session> SessionManager::open(TransportKind kind) {
    reapFinished();

    std::lock_guard<std::mutex> lock(mtx);
    if (stopping) {
        return nullptr;
    }

    std::string id = generateSessionId();
    while (sessions.count(id)) {
        id = generateSessionId();
    }

    auto session = std::make_shared<Session>(id, kind, options.queueCapacity);
    Entry entry;
    entry.session = session;
    entry.thread = std::thread(&SessionManager::runSession, this, session);
    sessions.emplace(id, std::move(entry));

    Logger::getInstance().info("Session " + id + " opened (" + transportKindName(kind) + ")");
    return session;
}

std::shared_ptr<Session> SessionManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(id);
    if (it == sessions.end() || it->second.session->isFinished()) {
        return nullptr;
    }
    return it->second.session;
}

void SessionManager::close(const std::string& id) {
    auto session = find(id);
    if (session) session->closeInput();
}

void SessionManager::abort(const std::string& id) {
    auto session = find(id);
    if (session) {
        Logger::getInstance().warn("Session " + id + " aborted by transport");
        session->abort();
    }
}

size_t SessionManager::activeCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t n = 0;
    for (const auto& [id, entry] : sessions) {
        if (!entry.session->isFinished()) n++;
    }
    return n;
}

void SessionManager::runSession(std::shared_ptr<Session> session) {
    try {
        ProtocolCore core(catalog, capabilities, options.core);
        core.run(*session);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Session " + session->getId() + " faulted: " + e.what());
    }

    session->input().close();
    session->output().close();
    session->markFinished();
    Logger::getInstance().info("Session " + session->getId() + " closed");
}

void SessionManager::reapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (it->second.session->isFinished()) {
                done.push_back(std::move(it->second.thread));
                it = sessions.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void SessionManager::monitorLoop() {
    const auto tick = std::chrono::milliseconds(500);
    std::unique_lock<std::mutex> lock(monitorMutex);
    while (true) {
        monitorCv.wait_for(lock, tick);
        {
            std::lock_guard<std::mutex> guard(mtx);
            if (stopping) return;
        }
        lock.unlock();

        reapFinished();

        if (options.idleTimeout.count() > 0) {
            std::vector<std::shared_ptr<Session>> idle;
            auto now = std::chrono::steady_clock::now();
            {
                std::lock_guard<std::mutex> guard(mtx);
                for (const auto& [id, entry] : sessions) {
                    if (!entry.session->isFinished() && now - entry.session->getLastActivity() > options.idleTimeout) {
                        idle.push_back(entry.session);
                    }
                }
            }
            for (auto& session : idle) {
                Logger::getInstance().info("Session " + session->getId() + " idle, closing");
                session->closeInput();
            }
        }

        lock.lock();
    }
}

void SessionManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping && !monitor.joinable() && sessions.empty()) return;
        stopping = true;
        for (auto& [id, entry] : sessions) {
            entry.session->closeInput();
        }
    }

    {
        std::lock_guard<std::mutex> lock(monitorMutex);
    }
    monitorCv.notify_all();
    if (monitor.joinable() && monitor.get_id() != std::this_thread::get_id()) {
        monitor.join();
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& [id, entry] : sessions) {
            threads.push_back(std::move(entry.thread));
        }
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    std::lock_guard<std::mutex> lock(mtx);
    sessions.clear();
}
