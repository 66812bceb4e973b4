#include "DummyStatsDClient.hpp"

std::shared_ptr<DummyStatsDClient> DummyStatsDClient::instance = nullptr;
std::once_flag DummyStatsDClient::init_flag;

std::shared_ptr<DummyStatsDClient> DummyStatsDClient::getInstance() {
    std::call_once(init_flag, []() {
        instance = std::shared_ptr<DummyStatsDClient>(new DummyStatsDClient());
    });
    return instance;
}

void DummyStatsDClient::increment(const std::string& /* key */, int /* value */) {}

void DummyStatsDClient::decrement(const std::string& /* key */, int /* value */) {}

void DummyStatsDClient::gauge(const std::string& /* key */, double /* value */) {}

void DummyStatsDClient::timing(const std::string& /* key */, std::chrono::milliseconds /* value */) {}
