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
#include <type_traits>
#include <vector>

#include <gpgpu_image.h>

#include "test_support.h"

using gpgpu::HostImage;
using gpgpu::Luma;
using gpgpu::Rgba;

TEST_CASE("host images validate their storage", "[interop]") {
    HostImage<Rgba<uint8_t> > blank(3, 2);
    REQUIRE(blank.data().size() == 3 * 2 * 4);
    REQUIRE(HostImage<Luma<uint8_t> >::channels() == 1);

    REQUIRE_THROWS_AS(HostImage<Rgba<uint8_t> >(2, 2, std::vector<uint8_t>(15)), std::invalid_argument);
    REQUIRE_NOTHROW(HostImage<Luma<uint8_t> >(2, 2, std::vector<uint8_t>(4)));
}

TEST_CASE("host image pixel access", "[interop]") {
    HostImage<Rgba<uint8_t> > img(2, 2);
    uint8_t *p = img.pixel(1, 1);
    p[0] = 10;
    p[3] = 40;
    REQUIRE(img.data()[12] == 10);
    REQUIRE(img.data()[15] == 40);

    REQUIRE_THROWS_AS(img.pixel(2, 0), std::out_of_range);
    REQUIRE_THROWS_AS(img.pixel(0, 2), std::out_of_range);
}

TEST_CASE("pixel type mapping", "[interop]") {
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Rgba<uint8_t> >::Gpu, gpgpu::pixels::Rgba8Uint>::value);
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Rgba<uint8_t> >::NormGpu, gpgpu::pixels::Rgba8UintNorm>::value);
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Rgba<int8_t> >::Gpu, gpgpu::pixels::Rgba8Sint>::value);
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Rgba<int8_t> >::NormGpu, gpgpu::pixels::Rgba8SintNorm>::value);
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Luma<uint8_t> >::Gpu, gpgpu::pixels::Luma8>::value);
    STATIC_REQUIRE(std::is_same<gpgpu::PixelMapping<Luma<uint8_t> >::NormGpu, gpgpu::pixels::Luma8Norm>::value);

    STATIC_REQUIRE(std::is_same<gpgpu::HostPixelOf<gpgpu::pixels::Rgba8UintNorm>::type, Rgba<uint8_t> >::value);
    STATIC_REQUIRE(std::is_same<gpgpu::HostPixelOf<gpgpu::pixels::Rgba8Sint>::type, Rgba<int8_t> >::value);
    STATIC_REQUIRE(std::is_same<gpgpu::HostPixelOf<gpgpu::pixels::Luma8Norm>::type, Luma<uint8_t> >::value);
}

namespace {
    HostImage<Rgba<uint8_t> > gradient(uint32_t width, uint32_t height) {
        HostImage<Rgba<uint8_t> > img(width, height);
        for (uint32_t y = 0; y < height; ++y) {
            for (uint32_t x = 0; x < width; ++x) {
                uint8_t *p = img.pixel(x, y);
                p[0] = static_cast<uint8_t>(x * 16);
                p[1] = static_cast<uint8_t>(y * 16);
                p[2] = static_cast<uint8_t>(x + y);
                p[3] = 255;
            }
        }
        return img;
    }
} // namespace

TEST_CASE("host images round trip through the device", "[interop][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    HostImage<Rgba<uint8_t> > src = gradient(6, 4);

    SECTION("integer pixels") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img = gpgpu::imageFromHost(*fw, src);
        REQUIRE(img.width() == 6);
        REQUIRE(img.height() == 4);
        HostImage<Rgba<uint8_t> > back = gpgpu::readToHostImage(img);
        REQUIRE(back.width() == 6);
        REQUIRE(back.height() == 4);
        REQUIRE(back.data() == src.data());
    }

    SECTION("normalised pixels") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8UintNorm> img = gpgpu::normalisedImageFromHost(*fw, src);
        REQUIRE(img.raw().format() == VK_FORMAT_R8G8B8A8_UNORM);
        REQUIRE(gpgpu::readToHostImage(img).data() == src.data());
    }

    SECTION("write into an existing image") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 6, 4);
        gpgpu::writeFromHostImage(img, src);
        gpgpu::Deferred<HostImage<Rgba<uint8_t> > > pending = gpgpu::readToHostImageAsync(img);
        REQUIRE(pending.wait().data() == src.data());
    }
}

TEST_CASE("host image writes need matching dimensions", "[interop][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 4, 4);
    HostImage<Rgba<uint8_t> > wrong = gradient(2, 8);
    size_t pendingBefore = fw->pendingSubmissions();
    REQUIRE_THROWS_AS(gpgpu::writeFromHostImage(img, wrong), gpgpu::TransferSizeError);
    REQUIRE(fw->pendingSubmissions() == pendingBefore);
}
