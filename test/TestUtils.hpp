#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

// Scratch directory named after the running test, removed by the caller
inline std::filesystem::path make_temp_root() {
    const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::filesystem::path dir = std::filesystem::temp_directory_path()
        / ("wtftp_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir / "root");
    return dir;
}

inline std::vector<uint8_t> make_content(size_t size) {
    std::vector<uint8_t> content(size);
    for (size_t i = 0; i < size; i++)
        content[i] = static_cast<uint8_t>((i * 7 + i / 251) % 256);
    return content;
}

inline std::vector<uint8_t> write_file(const std::filesystem::path& path, size_t size) {
    std::vector<uint8_t> content = make_content(size);
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(content.data()), content.size());
    return content;
}

// "name\0value\0..." after a two byte opcode
inline std::vector<uint8_t> make_packet(uint16_t opcode, const std::vector<std::string>& strings) {
    std::vector<uint8_t> buf;
    buf.push_back(static_cast<uint8_t>(opcode >> 8));
    buf.push_back(static_cast<uint8_t>(opcode & 0xff));
    for (const std::string& s : strings) {
        buf.insert(buf.end(), s.begin(), s.end());
        buf.push_back('\0');
    }
    return buf;
}
