#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "upload/upload_stager.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;
using test_support::TmpDir;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

bool feed(UploadStager& s, const std::string& data) {
    return s.append(data.data(), data.size());
}

} // namespace

TEST_CASE("UploadStager", "[upload]") {
    TmpDir dir("stager");

    SECTION("NoPartsLeavesNothing") {
        UploadStager stager(dir.str());
        REQUIRE_FALSE(stager.take().has_value());
        REQUIRE(dir.file_count() == 0);
        REQUIRE_FALSE(stager.failed());
    }

    SECTION("OtherFieldsAreIgnored") {
        UploadStager stager(dir.str());
        REQUIRE(stager.begin_part("comment", ""));
        REQUIRE(feed(stager, "hello"));
        REQUIRE(dir.file_count() == 0);
        REQUIRE_FALSE(stager.take().has_value());
    }

    SECTION("FilePartIsStaged") {
        UploadStager stager(dir.str());
        REQUIRE(stager.begin_part("file", "test.mp3"));
        REQUIRE(feed(stager, "ID3"));
        REQUIRE(feed(stager, "-payload"));

        auto up = stager.take();
        REQUIRE(up.has_value());
        REQUIRE(up->filename == "test.mp3");
        REQUIRE(up->bytes == 11);
        REQUIRE(read_file(up->file.path()) == "ID3-payload");

        auto name = fs::path(up->file.path()).filename().string();
        REQUIRE(name.starts_with("upload_"));
        REQUIRE(name.ends_with("_test.mp3"));
    }

    SECTION("StagedFileRemovedWithUpload") {
        std::string path;
        {
            UploadStager stager(dir.str());
            REQUIRE(stager.begin_part("file", "a.wav"));
            REQUIRE(feed(stager, "x"));
            auto up = stager.take();
            REQUIRE(up.has_value());
            path = up->file.path();
            REQUIRE(fs::exists(path));
        }
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("UnstakenUploadRemovedWithStager") {
        {
            UploadStager stager(dir.str());
            REQUIRE(stager.begin_part("file", "a.wav"));
            REQUIRE(feed(stager, "x"));
        }
        REQUIRE(dir.file_count() == 0);
    }

    SECTION("OnlyFirstFilePartIsKept") {
        UploadStager stager(dir.str());
        REQUIRE(stager.begin_part("file", "first.wav"));
        REQUIRE(feed(stager, "one"));
        REQUIRE(stager.begin_part("file", "second.wav"));
        REQUIRE(feed(stager, "two"));

        auto up = stager.take();
        REQUIRE(up.has_value());
        REQUIRE(up->filename == "first.wav");
        REQUIRE(read_file(up->file.path()) == "one");
        REQUIRE(dir.file_count() == 1);
    }

    SECTION("HostileFilenameStaysInTempDir") {
        UploadStager stager(dir.str());
        REQUIRE(stager.begin_part("file", "../../escape.wav"));
        REQUIRE(feed(stager, "data"));

        auto up = stager.take();
        REQUIRE(up.has_value());
        REQUIRE(up->filename == "../../escape.wav");
        REQUIRE(fs::path(up->file.path()).parent_path() == dir.path);
    }

    SECTION("EmptyFilePart") {
        UploadStager stager(dir.str());
        REQUIRE(stager.begin_part("file", "empty.wav"));

        auto up = stager.take();
        REQUIRE(up.has_value());
        REQUIRE(up->bytes == 0);
        REQUIRE(fs::exists(up->file.path()));
    }

    SECTION("MissingTempDirFails") {
        UploadStager stager((dir.path / "missing").string());
        REQUIRE_FALSE(stager.begin_part("file", "a.wav"));
        REQUIRE(stager.failed());
        REQUIRE_FALSE(stager.error().empty());
        REQUIRE_FALSE(stager.take().has_value());
    }
}
