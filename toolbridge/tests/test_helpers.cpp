#include "test_helpers.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <random>
#include <stdexcept>

#include <unistd.h>

using namespace toolbridge;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging(TOOLBRIDGE_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

ProcessResult FakeProcessRunner::run(const std::vector<std::string>& argv, const CancellationToken&) {
    ++call_count_;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.push_back(argv);
    }
    if (script_) {
        return script_(argv);
    }
    ProcessResult result;
    result.exit_code = 0;
    return result;
}

void FakeProcessRunner::set_result(ProcessResult result) {
    script_ = [result](const std::vector<std::string>&) { return result; };
}

std::vector<std::vector<std::string>> FakeProcessRunner::calls() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return calls_;
}

TestServer::TestServer(std::unique_ptr<project::ProjectStore> store)
    : session(store ? std::move(store) : std::make_unique<project::ProjectStore>("test")),
      context{config, runner, session} {
    tools::register_builtin_tools(registry);
}

Dispatcher& TestServer::dispatcher() {
    if (!dispatcher_) {
        dispatcher_ = std::make_unique<Dispatcher>(registry, context);
    }
    return *dispatcher_;
}

nlohmann::json TestServer::call(const std::string& tool, const nlohmann::json& arguments, int id) {
    auto response = dispatcher().dispatch(make_call(id, tool, arguments));
    if (!response) {
        throw std::logic_error("tools/call produced no response");
    }
    return codec::encode_response(*response);
}

nlohmann::json TestServer::request(const nlohmann::json& message) {
    auto response = dispatcher().dispatch(codec::decode_request(message));
    return response ? codec::encode_response(*response) : nlohmann::json();
}

Request make_request(int id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json message = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        message["params"] = params;
    }
    return codec::decode_request(message);
}

Request make_call(int id, const std::string& tool, const nlohmann::json& arguments) {
    return make_request(id, "tools/call", {{"name", tool}, {"arguments", arguments}});
}

std::vector<nlohmann::json> content_items(const nlohmann::json& response) {
    std::vector<nlohmann::json> items;
    for (const auto& entry : response.at("result").at("content")) {
        const auto& text = entry.at("text").get_ref<const std::string&>();
        nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
        items.push_back(parsed.is_discarded() ? nlohmann::json(text) : parsed);
    }
    return items;
}

nlohmann::json first_item(const nlohmann::json& response) {
    auto items = content_items(response);
    if (items.empty()) {
        throw std::logic_error("result has no content");
    }
    return items.front();
}

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("toolbridge_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" +
             std::to_string(rd()));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write(const std::string& relative, const std::string& content) const {
    auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
}

std::filesystem::path TempDir::mkdir(const std::string& relative) const {
    auto dir = path_ / relative;
    std::filesystem::create_directories(dir);
    return dir;
}

std::unique_ptr<tools::ToolHandler> make_test_tool(const std::string& name,
                                                   std::function<tools::ToolOutcome(tools::ToolCall&)> body,
                                                   std::vector<tools::ParameterSpec> parameters) {
    return std::make_unique<tools::FunctionToolHandler>(
        tools::ToolDescriptor{name, "test tool " + name, std::move(parameters), std::nullopt}, std::move(body));
}
