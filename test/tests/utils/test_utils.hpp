#pragma once

#include "gcp_log/core/timestamp.hpp"
#include <cstdint>
#include <string>
#include <vector>

class TestUtils {
public:
    static std::string readLogFile(const std::string &filename);
    static std::vector<std::string> readLines(const std::string &filename);
    static void cleanupLogFiles();

    /// 2021-12-20T16:33:41.643966093Z
    static gcplog::Timestamp referenceTime();
    static gcplog::Timestamp fromEpoch(long long seconds, long long nanos = 0);

private:
    static bool fileExists(const std::string &filename);
    static void removeFile(const std::string &filename);
};
