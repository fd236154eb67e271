/**
 * @file test_execution_engine.cpp
 * @brief End-to-end tests for ExecutionEngine: lifecycle, limits and isolation
 */

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

#include <chrono>
#include <thread>

using namespace sealbox;
using namespace sealbox::core;
using sealbox::testing::MakeRequest;
using sealbox::testing::TestEngine;
using nlohmann::json;

TEST_CASE("ExecutionEngine - Successful run", "[engine]") {
    TestEngine t;

    auto result = t.Run("function main(params) { return { doubled: params.x * 2, tag: 'ok' }; }",
                        json{{"x", 21}});

    REQUIRE(result.status == ExecutionStatus::SUCCESS);
    REQUIRE(result.error_kind == ErrorKind::NONE);
    REQUIRE(result.value["doubled"] == 42);
    REQUIRE(result.value["tag"] == "ok");
    REQUIRE_FALSE(result.execution_id.empty());
    REQUIRE(result.message.empty());
    REQUIRE(result.diagnostics.contains("steps"));
    REQUIRE(result.diagnostics["memory_ceiling_bytes"] == 16 * 1024 * 1024);
    REQUIRE(t.engine->ActiveContexts() == 0);

    SECTION("Wire form") {
        auto j = result.ToJson();
        REQUIRE(j["status"] == "success");
        REQUIRE(j["value"]["doubled"] == 42);
        REQUIRE_FALSE(j.contains("errorKind"));
    }
}

TEST_CASE("ExecutionEngine - Number fidelity", "[engine]") {
    TestEngine t;

    auto result = t.Run("function main() { return { big: 9007199254740991, neg: -7, half: 1.5, "
                        "inf: Infinity }; }");

    REQUIRE(result.IsSuccess());
    REQUIRE(result.value["big"].is_number_integer());
    REQUIRE(result.value["big"].get<std::int64_t>() == 9007199254740991LL);
    REQUIRE(result.value["neg"].get<std::int64_t>() == -7);
    REQUIRE(result.value["half"].get<double>() == 1.5);
    REQUIRE(result.value["inf"].is_null());
}

TEST_CASE("ExecutionEngine - Execution IDs are unique", "[engine]") {
    TestEngine t;
    auto first = t.Run("function main() { return 1; }");
    auto second = t.Run("function main() { return 1; }");
    REQUIRE(first.execution_id != second.execution_id);
    REQUIRE(t.engine->TotalExecutions() == 2);
}

TEST_CASE("ExecutionEngine - Global isolation between runs", "[engine][isolation]") {
    TestEngine t;

    auto writer = t.Run("function main() { leak = 'secret-value'; return typeof leak; }");
    REQUIRE(writer.IsSuccess());
    REQUIRE(writer.value == "string");

    auto reader = t.Run("function main() { return typeof leak; }");
    REQUIRE(reader.IsSuccess());
    REQUIRE(reader.value == "undefined");
}

TEST_CASE("ExecutionEngine - Prototype mutation does not persist", "[engine][isolation]") {
    TestEngine t;

    auto mutator = t.Run(
        "function main() {\n"
        "  try { Object.prototype.polluted = 'yes'; } catch (e) {}\n"
        "  try { Array.prototype.map = function () { return 'hijacked'; }; } catch (e) {}\n"
        "  return 1;\n"
        "}");
    REQUIRE(mutator.IsSuccess());

    auto observer = t.Run(
        "function main() { return { polluted: typeof ({}).polluted, mapped: [1, 2].map(function (x) { return x + 1; }) }; }");
    REQUIRE(observer.IsSuccess());
    REQUIRE(observer.value["polluted"] == "undefined");
    REQUIRE(observer.value["mapped"] == json::array({2, 3}));
}

TEST_CASE("ExecutionEngine - Memory ceiling", "[engine][limits]") {
    TestEngine t;

    auto request = MakeRequest("function main() { var big = new Array(100 * 1024 * 1024 / 8); return big.length; }");
    request.memory_ceiling_bytes = 5 * 1024 * 1024;
    auto result = t.engine->Execute(request);

    REQUIRE(result.status == ExecutionStatus::RESOURCE_EXCEEDED);
    REQUIRE(result.error_kind == ErrorKind::RESOURCE_EXCEEDED);
    REQUIRE(result.message.find("memory limit exceeded") != std::string::npos);
    REQUIRE(result.diagnostics["memory_ceiling_bytes"] == 5 * 1024 * 1024);

    SECTION("Incremental growth is charged too") {
        auto grow = MakeRequest(
            "function main() { var a = []; for (var i = 0; i < 5000000; i++) { a.push(i); } return a.length; }");
        grow.memory_ceiling_bytes = 5 * 1024 * 1024;
        grow.time_ceiling_ms = 10000;
        auto grown = t.engine->Execute(grow);
        REQUIRE(grown.status == ExecutionStatus::RESOURCE_EXCEEDED);
    }

    SECTION("Allocation within budget succeeds") {
        auto small = MakeRequest("function main() { return new Array(100000).length; }");
        auto ok = t.engine->Execute(small);
        REQUIRE(ok.IsSuccess());
        REQUIRE(ok.value == 100000);
        REQUIRE(ok.diagnostics["memory_peak_bytes"].get<std::size_t>() >= 800000);
    }
}

TEST_CASE("ExecutionEngine - Memory violation outranks a later timeout", "[engine][limits]") {
    TestEngine t;

    auto request = MakeRequest(
        "function main() {\n"
        "  try { var big = new Array(100 * 1024 * 1024 / 8); } catch (e) {}\n"
        "  while (true) {}\n"
        "}");
    request.memory_ceiling_bytes = 5 * 1024 * 1024;
    request.time_ceiling_ms = 200;
    auto result = t.engine->Execute(request);

    REQUIRE(result.status == ExecutionStatus::RESOURCE_EXCEEDED);
    REQUIRE(result.message.find("memory limit exceeded") != std::string::npos);
}

TEST_CASE("ExecutionEngine - Time ceiling", "[engine][limits]") {
    TestEngine t;

    auto request = MakeRequest("function main() { while (true) {} }");
    request.time_ceiling_ms = 1000;

    auto started = std::chrono::steady_clock::now();
    auto result = t.engine->Execute(request);
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    REQUIRE(result.status == ExecutionStatus::TIMEOUT);
    REQUIRE(result.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(result.message == "execution timed out after 1000 ms");
    REQUIRE(waited <= 2000);
    REQUIRE(result.elapsed_ms >= 900);
}

TEST_CASE("ExecutionEngine - Step ceiling", "[engine][limits]") {
    EngineConfig config;
    config.policy.max_steps = 50;
    TestEngine t(config);

    auto request = MakeRequest("function main() { while (true) {} }");
    request.time_ceiling_ms = 30000;
    auto result = t.engine->Execute(request);

    REQUIRE(result.status == ExecutionStatus::RESOURCE_EXCEEDED);
    REQUIRE(result.message.find("step limit exceeded") != std::string::npos);
    REQUIRE(result.diagnostics["steps"].get<std::uint64_t>() > 50);
}

TEST_CASE("ExecutionEngine - Stack overflow", "[engine][limits]") {
    TestEngine t;

    auto result = t.Run("function main() { function f(n) { return f(n + 1) + 1; } return f(0); }");

    REQUIRE(result.status == ExecutionStatus::RESOURCE_EXCEEDED);
    REQUIRE(result.message.find("stack limit exceeded") == 0);
}

TEST_CASE("ExecutionEngine - Script errors", "[engine]") {
    TestEngine t;

    SECTION("Uncaught error keeps name and message") {
        auto result = t.Run("function main() { throw new TypeError('boom'); }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.error_kind == ErrorKind::SCRIPT_ERROR);
        REQUIRE(result.message == "TypeError: boom");
        REQUIRE(result.diagnostics.contains("stack"));
        REQUIRE(result.value.is_null());
    }

    SECTION("Thrown primitive") {
        auto result = t.Run("function main() { throw 'plain'; }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.message == "plain");
    }

    SECTION("Syntax error") {
        auto result = t.Run("function main( { return 1; }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.message.find("SyntaxError") == 0);
    }

    SECTION("Error thrown while loading") {
        auto result = t.Run("throw new RangeError('at load');\nfunction main() { return 1; }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.message == "RangeError: at load");
    }
}

TEST_CASE("ExecutionEngine - Entry point resolution", "[engine]") {
    TestEngine t;

    SECTION("Missing entry point") {
        auto result = t.Run("function other() { return 1; }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.error_kind == ErrorKind::ENTRY_POINT_MISSING);
        REQUIRE(result.message == "entry point 'main' is not defined or not a function");
    }

    SECTION("Entry point that is not a function") {
        auto result = t.Run("var main = 5;");
        REQUIRE(result.error_kind == ErrorKind::ENTRY_POINT_MISSING);
    }

    SECTION("Custom entry point") {
        auto request = MakeRequest("function handler(p) { return p.name + '!'; }", json{{"name", "hi"}});
        request.entry_point = "handler";
        auto result = t.engine->Execute(request);
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == "hi!");
    }

    SECTION("Arrow function bound with const") {
        auto result = t.Run("const main = (p) => [p.a, p.b];", json{{"a", 1}, {"b", 2}});
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == json::array({1, 2}));
    }
}

TEST_CASE("ExecutionEngine - Promises returned by the entry point", "[engine]") {
    TestEngine t;

    SECTION("Async function") {
        auto result = t.Run("async function main(p) { const v = await Promise.resolve(p.x); return v * 2; }",
                            json{{"x", 5}});
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == 10);
    }

    SECTION("Rejection becomes a script error") {
        auto result = t.Run("async function main() { await null; throw new Error('rejected'); }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.message == "Error: rejected");
    }

    SECTION("Promise that never settles") {
        auto result = t.Run("function main() { return new Promise(function () {}); }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.message == "promise returned by entry point never settled");
    }
}

TEST_CASE("ExecutionEngine - Result validation", "[engine][validation]") {
    TestEngine t;

    SECTION("Nesting past the depth limit") {
        auto result = t.Run("function main() { var v = 1; for (var i = 0; i < 100; i++) { v = [v]; } return v; }");
        REQUIRE(result.status == ExecutionStatus::VALIDATION_ERROR);
        REQUIRE(result.error_kind == ErrorKind::VALIDATION_ERROR);
        REQUIRE(result.message.find("invalid result") == 0);
    }

    SECTION("Forbidden key in the result") {
        auto result = t.Run("function main() { return { nested: { constructor: 1 } }; }");
        REQUIRE(result.status == ExecutionStatus::VALIDATION_ERROR);
        REQUIRE(result.message.find("forbidden key") != std::string::npos);
    }

    SECTION("Undefined result maps to null") {
        auto result = t.Run("function main() {}");
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value.is_null());
    }
}

TEST_CASE("ExecutionEngine - Request rejection", "[engine][validation]") {
    TestEngine t;

    SECTION("Non-positive user") {
        auto request = MakeRequest("function main() { return 1; }");
        request.user_id = 0;
        auto result = t.engine->Execute(request);
        REQUIRE(result.status == ExecutionStatus::VALIDATION_ERROR);
        REQUIRE(result.error_kind == ErrorKind::INVALID_REQUEST);
        REQUIRE(result.execution_id.empty());
        REQUIRE(result.message == "invalid request: user ID must be positive");
    }

    SECTION("Missing function ID and source") {
        auto request = MakeRequest("function main() { return 1; }");
        request.function_id.clear();
        REQUIRE(t.engine->ValidateRequest(request) == std::string("function ID is required"));

        request = MakeRequest("");
        REQUIRE(t.engine->ValidateRequest(request) == std::string("source code is required"));
    }

    SECTION("Entry point must be an identifier") {
        auto request = MakeRequest("function main() { return 1; }");
        request.entry_point = "main; evil()";
        REQUIRE(t.engine->Execute(request).error_kind == ErrorKind::INVALID_REQUEST);

        request.entry_point = "return";
        REQUIRE(t.engine->Execute(request).error_kind == ErrorKind::INVALID_REQUEST);
    }

    SECTION("Ceilings outside the platform limits") {
        auto request = MakeRequest("function main() { return 1; }");
        request.memory_ceiling_bytes = 0;
        REQUIRE(t.engine->Execute(request).error_kind == ErrorKind::INVALID_REQUEST);

        request = MakeRequest("function main() { return 1; }");
        request.time_ceiling_ms = 10 * 60 * 1000;
        REQUIRE(t.engine->Execute(request).error_kind == ErrorKind::INVALID_REQUEST);
    }

    SECTION("Oversized source") {
        auto request = MakeRequest("function main() { return 1; }\n//" + std::string(200000, 'x'));
        REQUIRE(t.engine->Execute(request).error_kind == ErrorKind::INVALID_REQUEST);
    }

    SECTION("Parameters failing validation") {
        json params;
        params["__proto__"] = json{{"admin", true}};
        auto result = t.Run("function main() { return 1; }", params);
        REQUIRE(result.status == ExecutionStatus::VALIDATION_ERROR);
        REQUIRE(result.error_kind == ErrorKind::VALIDATION_ERROR);
        REQUIRE_FALSE(result.execution_id.empty());
        REQUIRE(result.message.find("forbidden key") != std::string::npos);
        REQUIRE(result.diagnostics["steps"] == 0);
    }

    REQUIRE(t.engine->ActiveContexts() == 0);
}

TEST_CASE("ExecutionEngine - Secret access", "[engine][secrets]") {
    TestEngine t;
    t.store->Put(1, "api_key", "k-one");
    t.store->Put(2, "other_key", "k-two");

    SECTION("Own secret") {
        auto result = t.Run("function main() { return getSecret('api_key'); }");
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == "k-one");
        REQUIRE(t.audit->Count("secret.read") == 1);
        REQUIRE(t.audit->Entries()[0].success);
    }

    SECTION("secrets.get is the same capability") {
        auto result = t.Run("function main() { return secrets.get('api_key'); }");
        REQUIRE(result.value == "k-one");
    }

    SECTION("Another tenant's secret is denied") {
        auto result = t.Run("function main() { return getSecret('other_key'); }");
        REQUIRE(result.status == ExecutionStatus::SECRET_ACCESS_DENIED);
        REQUIRE(result.error_kind == ErrorKind::SECRET_ACCESS_DENIED);
        REQUIRE(result.message == "SecretAccessDenied: access to secret 'other_key' denied");
        REQUIRE(result.message.find("k-two") == std::string::npos);

        auto entries = t.audit->Entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].action == "secret.read");
        REQUIRE(entries[0].subject == "other_key");
        REQUIRE_FALSE(entries[0].success);
        REQUIRE(entries[0].user_id == 1);
        REQUIRE(entries[0].execution_id == result.execution_id);
    }

    SECTION("Audit entries follow call order") {
        t.store->Put(1, "second_key", "k-three");
        auto result = t.Run(
            "function main() {\n"
            "  getSecret('second_key');\n"
            "  getSecret('api_key');\n"
            "  try { getSecret('missing'); } catch (e) {}\n"
            "  return getSecret('second_key');\n"
            "}");
        REQUIRE(result.IsSuccess());

        auto entries = t.audit->Entries();
        REQUIRE(entries.size() == 4);
        REQUIRE(entries[0].subject == "second_key");
        REQUIRE(entries[1].subject == "api_key");
        REQUIRE(entries[2].subject == "missing");
        REQUIRE_FALSE(entries[2].success);
        REQUIRE(entries[3].subject == "second_key");
        REQUIRE(entries[3].success);
    }

    SECTION("Access made before a timeout is still audited") {
        auto request = MakeRequest("function main() { getSecret('api_key'); while (true) {} }");
        request.time_ceiling_ms = 200;
        auto result = t.engine->Execute(request);

        REQUIRE(result.status == ExecutionStatus::TIMEOUT);
        auto entries = t.audit->Entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].subject == "api_key");
        REQUIRE(entries[0].success);
        REQUIRE(entries[0].execution_id == result.execution_id);
    }

    SECTION("A caught denial does not fail the run") {
        auto result = t.Run("function main() { try { getSecret('nope'); } catch (e) { return e.name; } }");
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == "SecretAccessDenied");
        REQUIRE(result.diagnostics["secret_lookups"] == 1);
    }

    SECTION("Unavailable store") {
        auto store = std::make_shared<testing::UnavailableSecretStore>();
        auto engine = EngineBuilder()
            .WithSecretStore(store)
            .WithAuditSink(t.audit)
            .EnableNetwork(false)
            .Build();
        auto result = engine->Execute(MakeRequest("function main() { return getSecret('api_key'); }"));
        REQUIRE(result.status == ExecutionStatus::SECRET_ACCESS_DENIED);
    }
}

TEST_CASE("ExecutionEngine - Console capture", "[engine][logs]") {
    SECTION("Levels and formatting") {
        TestEngine t;
        auto result = t.Run(
            "function main() { console.log('hello', { a: 1 }, 2); console.error('bad'); return 0; }");
        REQUIRE(result.IsSuccess());
        REQUIRE(result.logs.size() == 2);
        REQUIRE(result.logs[0] == "[log] hello {\"a\":1} 2");
        REQUIRE(result.logs[1] == "[error] bad");
        REQUIRE(result.diagnostics["logs_truncated"] == false);
    }

    SECTION("Entry limit") {
        EngineConfig config;
        config.policy.max_log_entries = 3;
        TestEngine t(config);
        auto result = t.Run("function main() { for (var i = 0; i < 10; i++) console.log(i); return 0; }");
        REQUIRE(result.IsSuccess());
        REQUIRE(result.logs.size() == 3);
        REQUIRE(result.diagnostics["logs_truncated"] == true);
    }

    SECTION("Logs survive a failing run") {
        TestEngine t;
        auto result = t.Run("function main() { console.log('before'); throw new Error('after'); }");
        REQUIRE(result.status == ExecutionStatus::SCRIPT_ERROR);
        REQUIRE(result.logs == std::vector<std::string>{"[log] before"});
    }
}

TEST_CASE("ExecutionEngine - Concurrent executions", "[engine][concurrency]") {
    TestEngine t;

    std::vector<std::future<ExecutionResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(t.engine->ExecuteAsync(MakeRequest(
            "var counter = 0;\n"
            "function main(p) { for (var i = 0; i < 1000; i++) counter++; globalThis.mark = p.id; return [p.id, counter, globalThis.mark]; }",
            json{{"id", i}})));
    }

    for (int i = 0; i < 8; ++i) {
        auto result = futures[i].get();
        REQUIRE(result.IsSuccess());
        REQUIRE(result.value == json::array({i, 1000, i}));
    }
    REQUIRE(t.engine->ActiveContexts() == 0);
    REQUIRE(t.engine->TotalExecutions() == 8);
}

TEST_CASE("ExecutionEngine - Cancellation", "[engine][concurrency]") {
    TestEngine t;

    REQUIRE_FALSE(t.engine->Cancel("exec_unknown"));

    auto request = MakeRequest("function main() { while (true) {} }");
    request.time_ceiling_ms = 20000;
    auto future = t.engine->ExecuteAsync(request);

    bool cancelled = false;
    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!cancelled && std::chrono::steady_clock::now() < give_up) {
        for (const auto& id : t.engine->ActiveExecutionIds()) {
            cancelled = t.engine->Cancel(id) || cancelled;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(cancelled);

    auto result = future.get();
    REQUIRE(result.status == ExecutionStatus::TIMEOUT);
    REQUIRE(result.error_kind == ErrorKind::TIMEOUT);
    REQUIRE(result.message == "execution cancelled");
    REQUIRE(result.elapsed_ms < 20000);
    REQUIRE(t.engine->ActiveContexts() == 0);
}

TEST_CASE("ExecutionEngine - Destroyed with a run in flight", "[engine][concurrency]") {
    TestEngine t;

    auto request = MakeRequest("function main() { while (true) {} }");
    request.time_ceiling_ms = 20000;
    auto future = t.engine->ExecuteAsync(request);

    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (t.engine->ActiveContexts() == 0 && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(t.engine->ActiveContexts() == 1);

    // Blocks until the running context has been cancelled and unwound
    t.engine.reset();

    REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.status == ExecutionStatus::TIMEOUT);
    REQUIRE(result.message == "execution cancelled");
    REQUIRE(result.elapsed_ms < 20000);
}

TEST_CASE("EngineBuilder - Missing collaborators", "[engine]") {
    EngineConfig config;
    REQUIRE_THROWS_AS(ExecutionEngine(config, EngineCollaborators{}), SealboxError);

    auto engine = EngineBuilder()
        .WithAuditSink(std::make_shared<testing::RecordingAuditSink>())
        .EnableNetwork(false)
        .Build();
    REQUIRE(engine->Execute(MakeRequest("function main() { return typeof fetch; }")).value == "undefined");
}
