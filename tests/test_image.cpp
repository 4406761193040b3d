/*
   Copyright 2023 Reese Levine, Devon McKee, Sean Siddens

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <cstdint>
#include <vector>

#include "test_support.h"

TEST_CASE("images reject zero dimensions", "[image][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    REQUIRE_THROWS_AS(gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>(*fw, 0, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>(*fw, 4, 0), std::invalid_argument);

    uint32_t tooWide = fw->limits().maxImageDimension2D + 1;
    REQUIRE_THROWS_AS(gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>(*fw, tooWide, 1), std::invalid_argument);
}

TEST_CASE("new images read back as zeros", "[image][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 3, 2);
    REQUIRE(img.width() == 3);
    REQUIRE(img.height() == 2);
    REQUIRE(img.byteSize() == 3 * 2 * 4);
    REQUIRE(img.raw().format() == VK_FORMAT_R8G8B8A8_UINT);
    REQUIRE(img.read() == std::vector<uint8_t>(24, 0));
}

TEST_CASE("image bytes round trip", "[image][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    std::vector<uint8_t> bytes(5 * 3 * 4);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(i * 3 + 1);
    }

    SECTION("integer format") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img =
            gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>::fromBytes(*fw, 5, 3, bytes);
        REQUIRE(img.read() == bytes);
    }

    SECTION("normalised format") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8UintNorm> img =
            gpgpu::GpuImage<gpgpu::pixels::Rgba8UintNorm>::fromBytes(*fw, 5, 3, bytes);
        REQUIRE(img.raw().format() == VK_FORMAT_R8G8B8A8_UNORM);
        REQUIRE(img.read() == bytes);
    }

    SECTION("overwrite") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 5, 3);
        img.write(bytes);
        REQUIRE(img.read() == bytes);
        img.writeBytes(std::vector<uint8_t>(bytes.size(), 9).data(), bytes.size());
        REQUIRE(img.read() == std::vector<uint8_t>(bytes.size(), 9));
    }
}

TEST_CASE("image writes must cover the whole image", "[image][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 2, 2);
    std::vector<uint8_t> shortBytes(15, 1);
    try {
        img.write(shortBytes);
        FAIL("short image write was accepted");
    } catch (const gpgpu::TransferSizeError &e) {
        REQUIRE(e.expectedBytes() == 16);
        REQUIRE(e.actualBytes() == 15);
    }
    REQUIRE_THROWS_AS(gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>::fromBytes(*fw, 2, 2, std::vector<uint8_t>(17, 0)),
                      gpgpu::TransferSizeError);
}
