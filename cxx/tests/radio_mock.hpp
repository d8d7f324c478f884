/**
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/beacon/Radio.hpp"
#include "uxbeacon/core/utils/casts.hpp"

class RadioMock : public uxbeacon::beacon::Radio {
public:
    struct Advertisement {
        std::string name;
        std::vector<std::byte> manufacturer_data;
    };

public:
    void onReady(ReadyCallback callback) override { ready_callback_ = std::move(callback); }

    void startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) override {
        if(refuse_) {
            throw uxbeacon::beacon::AdvertisementError("refused by mock");
        }
        advertisements_.push_back({std::string(name), {manufacturer_data.begin(), manufacturer_data.end()}});
    }

    /** Simulate a ready notification */
    void powerOn() {
        if(ready_callback_) {
            ready_callback_();
        }
    }

    void setRefuse(bool refuse) { refuse_ = refuse; }

    bool hasReadyCallback() const { return static_cast<bool>(ready_callback_); }

    const std::vector<Advertisement>& getAdvertisements() const { return advertisements_; }

private:
    ReadyCallback ready_callback_;
    std::vector<Advertisement> advertisements_;
    bool refuse_ {false};
};

/** Temporary file removed on destruction */
class TemporaryFile {
public:
    explicit TemporaryFile(std::string_view name)
        : path_(std::filesystem::temp_directory_path() / ("uxbeacon_test_" + std::string(name))) {}

    TemporaryFile(std::string_view name, std::span<const std::byte> content) : TemporaryFile(name) { write(content); }

    TemporaryFile(std::string_view name, std::string_view content)
        : TemporaryFile(name, uxbeacon::utils::to_byte_span(content)) {}

    ~TemporaryFile() {
        std::error_code ec {};
        std::filesystem::remove(path_, ec);
    }

    /// @cond doxygen_suppress
    TemporaryFile(const TemporaryFile& other) = delete;
    TemporaryFile& operator=(const TemporaryFile& other) = delete;
    TemporaryFile(TemporaryFile&& other) = delete;
    TemporaryFile& operator=(TemporaryFile&& other) = delete;
    /// @endcond

    void write(std::span<const std::byte> content) const {
        std::ofstream file {path_, std::ios::binary | std::ios::trunc};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};
