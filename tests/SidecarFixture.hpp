#pragma once

#include <gtest/gtest.h>

#include <fcntl.h>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/DigestUtils.hpp"
#include "utils/TrustedDigest.hpp"

namespace fs = std::filesystem;

// Ideiglenes könyvtár + shell script stubok, amik sidecarként futtathatók
class SidecarFixture : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              ("axiom_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
               std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    // O_CLOEXEC: egy párhuzamos fork ne tartsa nyitva írásra (ETXTBSY)
    fs::path writeFile(const std::string& name, const std::string& content, mode_t mode = 0755) {
        fs::path p = dir / name;
        int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
        if (fd < 0) {
            ADD_FAILURE() << "cannot create " << p;
            return p;
        }
        std::size_t off = 0;
        while (off < content.size()) {
            ssize_t n = ::write(fd, content.data() + off, content.size() - off);
            if (n <= 0) break;
            off += static_cast<std::size_t>(n);
        }
        ::close(fd);
        ::chmod(p.c_str(), mode);
        EXPECT_EQ(off, content.size());
        return p;
    }

    fs::path writeStub(const std::string& name, const std::string& body, mode_t mode = 0755) {
        return writeFile(name, "#!/bin/sh\n" + body, mode);
    }

    static Axiom::Security::TrustedDigest digestOf(const fs::path& p) {
        auto hex = AxiomUtils::sha256File(p);
        EXPECT_TRUE(hex.has_value()) << p;
        return Axiom::Security::TrustedDigest::fromString(hex.value_or(std::string(64, '0')));
    }

    // Két script azonos méretre hozása komment kitöltéssel
    static void padToSameSize(std::string& a, std::string& b) {
        while (a.size() < b.size()) a += '#';
        while (b.size() < a.size()) b += '#';
    }

    fs::path dir;
};
