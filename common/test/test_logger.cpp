// test_logger.cpp
#include "utils/AsyncLogging.h"
#include "utils/Logger.h"
#include "utils/Timestamp.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using pathviz::utils::Timestamp;

static int g_failures = 0;

static void Check(bool cond, const std::string& name) {
    if (cond) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cerr << "[FAIL] " << name << std::endl;
        ++g_failures;
    }
}

static std::string ReadAll(const std::string& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static void TestTimestamp() {
    Timestamp t = Timestamp::now();
    Check(t.toFormattedString(false).size() == 19, "seconds format is YYYY-MM-DD HH:MM:SS");
    Check(t.toFormattedString(true).size() == 26, "microsecond format adds .uuuuuu");

    Timestamp a(1000000), b(1002500);
    Check(Timestamp::msDifference(b, a) == 2.5, "msDifference in milliseconds");
    Check(a < b, "timestamps ordered");
}

static void TestFileLogging() {
    std::string path = (std::filesystem::temp_directory_path() / "pathviz_test_logger.log").string();
    std::filesystem::remove(path);

    Logger::Instance().SetLevel(INFO);
    Check(Logger::Instance().Open(path), "log file opens");
    LOG_DEBUG("filtered-line %d", 1);
    LOG_INFO("kept-line %d", 2);
    LOG_ERROR("error-line %s", "x");
    Logger::Instance().Close();

    std::string content = ReadAll(path);
    Check(content.find("kept-line 2") != std::string::npos, "INFO line flushed to file on close");
    Check(content.find("[ERROR]") != std::string::npos, "level tag written");
    Check(content.find("filtered-line") == std::string::npos, "DEBUG filtered at INFO level");
    Check(content.find("\x1b[") == std::string::npos, "file output has no ANSI colors");
    std::filesystem::remove(path);
}

static void TestOpenFailure() {
    Check(!Logger::Instance().Open("/nonexistent-dir/pathviz.log"), "unopenable log file reported");

    AsyncLogging backend("/nonexistent-dir/pathviz.log");
    Check(!backend.start(), "AsyncLogging start fails without a file");
}

int main() {
    TestTimestamp();
    TestFileLogging();
    TestOpenFailure();

    std::cout << (g_failures == 0 ? "ALL PASSED" : "FAILURES: " + std::to_string(g_failures)) << std::endl;
    return g_failures == 0 ? 0 : 1;
}
