#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include "gcp_log.hpp"
#include "null_transport.hpp"

// ---------------------------------------------------------------------------
// BM_SerializeEmpty
// Floor cost of toJsonLine(): no fields, output "{}".
// ---------------------------------------------------------------------------
static void BM_SerializeEmpty(benchmark::State& state) {
    gcplog::StructuredLogEntry entry;
    for (auto _ : state) {
        std::string line = gcplog::toJsonLine(entry);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SerializeEmpty);

// ---------------------------------------------------------------------------
// BM_SerializeTypical
// The shape a request handler emits: severity, message, time, operation and
// source location.
// ---------------------------------------------------------------------------
static void BM_SerializeTypical(benchmark::State& state) {
    gcplog::StructuredLogEntry entry;
    entry.setSeverity(gcplog::LogSeverity::Info)
         .setMessage("Start logging")
         .setTime(std::chrono::system_clock::now())
         .setOperation(gcplog::Operation().setId("My Service").setProducer("MyService.Backend"))
         .setSourceLocation(gcplog::SourceLocation().setFile("main.cpp").setLineNumber(11).setFunction("log"));

    for (auto _ : state) {
        std::string line = gcplog::toJsonLine(entry);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SerializeTypical);

// ---------------------------------------------------------------------------
// BM_SerializeWithHttpRequest
// Adds the nested httpRequest object and labels.
// ---------------------------------------------------------------------------
static void BM_SerializeWithHttpRequest(benchmark::State& state) {
    gcplog::StructuredLogEntry entry;
    entry.setSeverity(gcplog::LogSeverity::Warning)
         .setMessage("slow request")
         .setTime(std::chrono::system_clock::now())
         .addLabel("env", "prod")
         .addLabel("region", "europe-west1");
    entry.mutableHttpRequest()
         .setRequestMethod(gcplog::HttpMethod::Get)
         .setRequestUrl("https://example.com/api/users")
         .setStatus(200)
         .setLatency("1.204s")
         .setProtocol("HTTP/1.1");

    for (auto _ : state) {
        std::string line = gcplog::toJsonLine(entry);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SerializeWithHttpRequest);

// ---------------------------------------------------------------------------
// BM_FormatTimestamp
// ---------------------------------------------------------------------------
static void BM_FormatTimestamp(benchmark::State& state) {
    auto now = std::chrono::system_clock::now();
    for (auto _ : state) {
        std::string text = gcplog::formatTimestamp(now);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatTimestamp);

// ---------------------------------------------------------------------------
// BM_FormatRecordEndToEnd
// Record -> entry -> JSON line -> transport, as a facade would drive it.
// ---------------------------------------------------------------------------
static void BM_FormatRecordEndToEnd(benchmark::State& state) {
    gcplog::FormatterOptions options;
    options.operationId("My Service").operationProducer("MyService.Backend");
    gcplog::StructuredFormatter formatter(options);
    gcplog::NullTransport transport;

    gcplog::LogRecord record(gcplog::LogLevel::ERROR, "Yeah, this is not good.");
    record.target = "services::backend";
    record.file = "main.cpp";
    record.line = 42;
    record.function = "handle";

    for (auto _ : state) {
        transport.write(formatter.format(record));
    }
    benchmark::DoNotOptimize(transport.bytes());
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatRecordEndToEnd);
