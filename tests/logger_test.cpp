/*
 * Logger levels and sink redirection.
 */
#include <rankpoll/core/logger.hpp>
#include "check.hpp"

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace rankpoll;

namespace {

std::string read_all(FILE* f) {
    std::string out;
    rewind(f);
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    return out;
}

} // anonymous namespace

static int test_parse_level_names() {
    EXPECT(parse_log_level("debug") == LogLevel::DEBUG, "debug");
    EXPECT(parse_log_level(" WARNING ") == LogLevel::WARN, "case and whitespace");
    EXPECT(parse_log_level("Error") == LogLevel::ERROR, "error");
    EXPECT(parse_log_level("loud") == LogLevel::INFO, "unknown falls back to info");
    EXPECT(parse_log_level("loud", LogLevel::WARN) == LogLevel::WARN, "explicit fallback");
    EXPECT(std::string(log_level_str(LogLevel::WARN)) == "WARN", "level name");
    return 0;
}

static int test_threshold_filters_lines() {
    FILE* sink = tmpfile();
    EXPECT(sink != NULL, "temp sink");
    
    Logger& log = Logger::instance();
    log.set_sink(sink);
    log.set_level(LogLevel::WARN);
    LOG_DEBUG("hidden %d", 1);
    LOG_INFO("hidden %d", 2);
    LOG_WARN("Dropping %s message for unknown chain %s", "vote", "abc");
    LOG_ERROR("storage %s", "failed");
    log.set_sink(NULL);
    log.set_level(LogLevel::INFO);
    
    std::string out = read_all(sink);
    fclose(sink);
    EXPECT(out.find("hidden") == std::string::npos, "below threshold suppressed");
    EXPECT(out.find("[WARN] Dropping vote message for unknown chain abc\n") != std::string::npos, "warn line");
    EXPECT(out.find("[ERROR] storage failed\n") != std::string::npos, "error line");
    return 0;
}

static int test_error_always_logged() {
    FILE* sink = tmpfile();
    EXPECT(sink != NULL, "temp sink");
    
    Logger& log = Logger::instance();
    log.set_sink(sink);
    log.set_level(LogLevel::ERROR);
    LOG_WARN("quiet");
    LOG_ERROR("loud");
    log.set_sink(NULL);
    log.set_level(LogLevel::INFO);
    
    std::string out = read_all(sink);
    fclose(sink);
    EXPECT(out.find("quiet") == std::string::npos, "warn suppressed at error level");
    EXPECT(out.find("loud") != std::string::npos, "error written");
    return 0;
}

static int test_level_changes_while_threads_log() {
    FILE* sink = tmpfile();
    EXPECT(sink != NULL, "temp sink");
    
    Logger& log = Logger::instance();
    log.set_sink(sink);
    log.set_level(LogLevel::WARN);
    
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::thread([t] {
            for (int i = 0; i < 200; ++i) {
                LOG_WARN("worker %d line %d", t, i);
            }
        }));
    }
    for (int i = 0; i < 200; ++i) {
        Logger::instance().set_level(i % 2 ? LogLevel::ERROR : LogLevel::WARN);
    }
    for (size_t t = 0; t < workers.size(); ++t) {
        workers[t].join();
    }
    log.set_sink(NULL);
    log.set_level(LogLevel::INFO);
    
    std::string out = read_all(sink);
    fclose(sink);
    
    std::istringstream lines(out);
    std::string line;
    size_t count = 0;
    while (std::getline(lines, line)) {
        EXPECT(line.find("] [WARN] worker ") != std::string::npos, "every line whole");
        ++count;
    }
    EXPECT(count <= 800, "no line written twice");
    return 0;
}

int main() {
    int failures = 0;
    
    RUN_TEST(test_parse_level_names);
    RUN_TEST(test_threshold_filters_lines);
    RUN_TEST(test_error_always_logged);
    RUN_TEST(test_level_changes_while_threads_log);
    
    if (failures) {
        std::cout << "logger_test: " << failures << " failed.\n";
        return 1;
    }
    std::cout << "logger_test: Passed.\n";
    return 0;
}
