// String, file, configuration and HTTP helper tests (run via CTest).
#include "TestSupport.hpp"

#include "core/Config.hpp"
#include "core/downloader/DownloadCoordinator.hpp"
#include "core/downloader/HttpTransferClient.hpp"
#include "ui/ConsoleSurface.hpp"
#include "utils/FileUtils.hpp"
#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"

#include <cstdlib>
#include <sstream>

namespace {

using namespace courier::testing;
using courier::core::Config;
using courier::utils::FileUtils;
using courier::utils::HttpClient;
using courier::utils::StringUtils;

void test_format_bytes(TestContext &t) {
    t.check(StringUtils::formatBytes(0) == "0 B", "zero bytes");
    t.check(StringUtils::formatBytes(1023) == "1023 B", "bytes below 1 KB stay in B");
    t.check(StringUtils::formatBytes(1536) == "1.5 KB", "1536 bytes is 1.5 KB");
    t.check(StringUtils::formatBytes(5.0 * 1024 * 1024) == "5.0 MB", "5 MiB");
    t.check(StringUtils::formatBytes(3.0 * 1024 * 1024 * 1024) == "3.0 GB", "3 GiB");
}

void test_format_duration(TestContext &t) {
    t.check(StringUtils::formatDuration(59) == "59 sec", "under a minute");
    t.check(StringUtils::formatDuration(61) == "1 min 1 sec", "minutes and seconds");
    t.check(StringUtils::formatDuration(3700) == "1 hr 1 min", "hours and minutes");
}

void test_sanitize_file_name(TestContext &t) {
    t.check(StringUtils::sanitizeFileName("report.pdf") == "report.pdf", "plain names are kept");
    t.check(StringUtils::sanitizeFileName("../../etc/passwd") == "passwd", "directories are stripped");
    t.check(StringUtils::sanitizeFileName("a<b>:c?.txt") == "a_b__c_.txt", "reserved characters are replaced");
    t.check(StringUtils::sanitizeFileName(" .hidden. ") == "hidden", "leading and trailing dots are trimmed");
    t.check(StringUtils::sanitizeFileName("...") == "unnamed_file", "empty result falls back");
}

void test_split_and_parse(TestContext &t) {
    auto words = StringUtils::splitWords("  get   http://x/a.zip  my file.zip ", 3);
    t.check(words.size() == 3, "split should stop at maxParts");
    t.check(words.size() == 3 && words[2] == "my file.zip", "last part keeps the rest of the line");

    t.check(StringUtils::parseInt("42") == std::optional<int>(42), "parseInt accepts digits");
    t.check(!StringUtils::parseInt("42x").has_value(), "parseInt rejects trailing garbage");
    t.check(!StringUtils::parseInt("").has_value(), "parseInt rejects empty input");

    const std::string id = StringUtils::generateShortId(8);
    t.check(id.size() == 8, "short id should have 8 characters");
    t.check(id.find_first_not_of("0123456789abcdef") == std::string::npos, "short id should be hex");
}

void test_unique_file_path(TestContext &t) {
    TempDir dir;
    t.check(FileUtils::uniqueFilePath(dir.path(), "a.txt") == dir.path() / "a.txt", "free name is used as-is");

    writeFile(dir.path() / "a.txt", "x");
    t.check(FileUtils::uniqueFilePath(dir.path(), "a.txt") == dir.path() / "a (1).txt",
            "taken name gets a counter");

    writeFile(dir.path() / "a (1).txt", "x");
    t.check(FileUtils::uniqueFilePath(dir.path(), "a.txt") == dir.path() / "a (2).txt",
            "counter increments past taken names");

    auto reserved = FileUtils::uniqueFilePath(dir.path(), "b.txt", [&dir](const fs::path &p) {
        return p == dir.path() / "b.txt";
    });
    t.check(reserved == dir.path() / "b (1).txt", "reserved names count as taken");

    t.check(FileUtils::relativePath(dir.path() / "20240101" / "x.bin", dir.path()) == "20240101/x.bin",
            "relative path uses generic separators");
    t.check(FileUtils::getFileSize(dir.path() / "missing") == 0, "missing file has size 0");
    t.check(FileUtils::deleteFile(dir.path() / "a.txt"), "deleteFile removes an existing file");
    t.check(!FileUtils::deleteFile(dir.path() / "a.txt"), "deleteFile reports a missing file");
}

void test_config_defaults_and_paths(TestContext &t) {
    auto &config = Config::instance();
    config.setDefaults();

    t.check(config.get<int>("downloads.maxConcurrent") == 5, "default ceiling is 5");
    t.check(config.get<int>("downloads.maxRetries") == 3, "default retries is 3");
    t.check(config.get<std::string>("downloads.directory") == "downloads", "default directory");
    t.check(config.get<int>("downloads.missing", 17) == 17, "missing keys use the default");
    t.check(config.get<int>("downloads.directory", 9) == 9, "mistyped keys use the default");

    config.set("downloads.maxConcurrent", 2);
    t.check(config.get<int>("downloads.maxConcurrent") == 2, "set should update nested keys");
    t.check(config.has("logging.level"), "has should see nested keys");
}

void test_config_environment(TestContext &t) {
    auto &config = Config::instance();
    config.setDefaults();

    ::setenv("DOWNLOAD_PATH", "/tmp/courier-dl", 1);
    ::setenv("MAX_CONCURRENT_DOWNLOADS", "7", 1);
    ::setenv("MAX_RETRIES", "not-a-number", 1);
    ::setenv("UPDATE_INTERVAL", "2", 1);
    config.loadEnvironment();
    ::unsetenv("DOWNLOAD_PATH");
    ::unsetenv("MAX_CONCURRENT_DOWNLOADS");
    ::unsetenv("MAX_RETRIES");
    ::unsetenv("UPDATE_INTERVAL");

    t.check(config.get<std::string>("downloads.directory") == "/tmp/courier-dl", "DOWNLOAD_PATH overrides");
    t.check(config.get<int>("downloads.maxConcurrent") == 7, "MAX_CONCURRENT_DOWNLOADS overrides");
    t.check(config.get<int>("downloads.maxRetries") == 3, "invalid MAX_RETRIES is ignored");
    t.check(config.get<int>("downloads.progressThrottleMs") == 2000, "UPDATE_INTERVAL is in seconds");
}

void test_config_file_round_trip(TestContext &t) {
    TempDir dir;
    const auto path = (dir.path() / "courier.json").string();
    writeFile(path, R"({"downloads": {"maxConcurrent": 0, "staleAfterSeconds": 60}})");

    auto &config = Config::instance();
    config.setDefaults();
    t.check(config.load(path), "config file should load");
    t.check(config.get<int>("downloads.maxRetries") == 3, "loaded file merges over defaults");

    auto settings = CoordinatorSettings::fromConfig(config);
    t.check(settings.maxConcurrent == 1, "ceiling below 1 is raised to 1");
    t.check(settings.staleAfter == std::chrono::seconds(60), "stale age comes from the file");
    t.check(settings.cleanupDelay == std::chrono::seconds(5), "cleanup delay keeps its default");

    writeFile(path, "{ not json");
    t.check(!config.load(path), "malformed file should be rejected");
    config.setDefaults();
}

void test_http_helpers(TestContext &t) {
    t.check(HttpTransferClient::parseRetryAfter("12") == 12, "numeric Retry-After is used");
    t.check(HttpTransferClient::parseRetryAfter(" 3 ") == 3, "Retry-After is trimmed");
    t.check(HttpTransferClient::parseRetryAfter("") == HttpTransferClient::kDefaultRetryAfterSeconds,
            "missing Retry-After uses the default");
    t.check(HttpTransferClient::parseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT") == 30,
            "date form falls back to the default");

    t.check(HttpClient::fileNameFromUrl("https://example.test/files/b.zip?sig=1#x") == "b.zip",
            "file name drops query and fragment");
    t.check(HttpClient::fileNameFromUrl("https://example.test").empty(), "URL without path has no name");

    courier::utils::HttpResponse response;
    response.statusCode = 429;
    response.headers["retry-after"] = "9";
    t.check(response.header("Retry-After") == "9", "header lookup is case-insensitive");
    t.check(response.isTooManyRequests() && response.isClientError(), "429 classification");
    t.check(!response.isServerError(), "429 is not a server error");
    response.statusCode = 502;
    t.check(response.isServerError() && !response.isClientError(), "502 is a server error");
}

void test_console_surface(TestContext &t) {
    std::ostringstream out;
    courier::ui::ConsoleSurface surface(out);
    const SurfaceRef ref = surface.newRef();

    t.check(surface.render(ref, "line one\nline two") == RenderStatus::Ok, "first render succeeds");
    t.check(surface.render(ref, "line one\nline two") == RenderStatus::NotModified,
            "same text again is NotModified");
    t.checkContains(out.str(), "[console#1] line two", "each line is tagged with its surface ref");
    t.check(surface.newRef().messageId == 2, "refs are numbered in order");

    t.check(surface.tracked() == 1, "one status area is remembered");
    surface.release(ref);
    t.check(surface.tracked() == 0, "released status areas are forgotten");
    t.check(surface.lastText(ref).empty(), "released ref has no text");
    t.check(surface.render(ref, "line one\nline two") == RenderStatus::Ok,
            "text is shown again after a release");
}

} // namespace

int main() {
    TestContext t;
    test_format_bytes(t);
    test_format_duration(t);
    test_sanitize_file_name(t);
    test_split_and_parse(t);
    test_unique_file_path(t);
    test_config_defaults_and_paths(t);
    test_config_environment(t);
    test_config_file_round_trip(t);
    test_http_helpers(t);
    test_console_surface(t);
    return finish(t, "courier_utils_tests");
}
