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

// gpgpu_image.h - Host image <-> GpuImage conversion
// --------------------------------------------------
// HostImage<Pixel> is a plain row-major CPU image. PixelMapping picks the
// device pixel type for a host pixel (integer or normalised); HostPixelOf goes
// the other way. Header-only.

#ifndef GPGPU_IMAGE_H
#define GPGPU_IMAGE_H

#include "gpgpu.h"

namespace gpgpu {
    // -------- Host pixel tags -------------------------------------------------------
    template <typename T>
    struct Rgba {
        typedef T Subpixel;
        static const size_t kChannels = 4;
    };

    template <typename T>
    struct Luma {
        typedef T Subpixel;
        static const size_t kChannels = 1;
    };

    // -------- Host image ------------------------------------------------------------
    template <typename Pixel>
    class HostImage {
    public:
        typedef typename Pixel::Subpixel Subpixel;

        HostImage() : width_(0), height_(0) {}

        // Zero-filled.
        HostImage(uint32_t width, uint32_t height)
            : width_(width), height_(height), data_(subpixelCount(width, height)) {}

        // data holds width * height * channels subpixels, row-major.
        HostImage(uint32_t width, uint32_t height, std::vector<Subpixel> data)
            : width_(width), height_(height), data_(std::move(data)) {
            if (data_.size() != subpixelCount(width, height)) {
                throw std::invalid_argument("HostImage " + std::to_string(width) + "x" + std::to_string(height) +
                                            " needs " + std::to_string(subpixelCount(width, height)) +
                                            " subpixels, got " + std::to_string(data_.size()));
            }
        }

        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }
        static size_t channels() { return Pixel::kChannels; }

        const std::vector<Subpixel> &data() const { return data_; }
        std::vector<Subpixel> &data() { return data_; }

        // First subpixel of pixel (x, y).
        Subpixel *pixel(uint32_t x, uint32_t y) {
            checkBounds(x, y);
            return &data_[(static_cast<size_t>(y) * width_ + x) * Pixel::kChannels];
        }

        const Subpixel *pixel(uint32_t x, uint32_t y) const {
            checkBounds(x, y);
            return &data_[(static_cast<size_t>(y) * width_ + x) * Pixel::kChannels];
        }

        std::vector<uint8_t> bytes() const { return vectorToBytes(data_); }

    private:
        static size_t subpixelCount(uint32_t width, uint32_t height) {
            return static_cast<size_t>(width) * height * Pixel::kChannels;
        }

        void checkBounds(uint32_t x, uint32_t y) const {
            if (x >= width_ || y >= height_) {
                throw std::out_of_range("HostImage pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                        ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
            }
        }

        uint32_t width_;
        uint32_t height_;
        std::vector<Subpixel> data_;
    };

    // -------- Pixel mapping ---------------------------------------------------------
    // Unsupported host pixels fail to compile.
    template <typename Pixel>
    struct PixelMapping;

    template <>
    struct PixelMapping<Rgba<uint8_t> > {
        typedef pixels::Rgba8Uint Gpu;
        typedef pixels::Rgba8UintNorm NormGpu;
    };

    template <>
    struct PixelMapping<Rgba<int8_t> > {
        typedef pixels::Rgba8Sint Gpu;
        typedef pixels::Rgba8SintNorm NormGpu;
    };

    template <>
    struct PixelMapping<Luma<uint8_t> > {
        typedef pixels::Luma8 Gpu;
        typedef pixels::Luma8Norm NormGpu;
    };

    template <typename GpuPixel>
    struct HostPixelOf;

    template <> struct HostPixelOf<pixels::Rgba8Uint> { typedef Rgba<uint8_t> type; };
    template <> struct HostPixelOf<pixels::Rgba8UintNorm> { typedef Rgba<uint8_t> type; };
    template <> struct HostPixelOf<pixels::Rgba8Sint> { typedef Rgba<int8_t> type; };
    template <> struct HostPixelOf<pixels::Rgba8SintNorm> { typedef Rgba<int8_t> type; };
    template <> struct HostPixelOf<pixels::Luma8> { typedef Luma<uint8_t> type; };
    template <> struct HostPixelOf<pixels::Luma8Norm> { typedef Luma<uint8_t> type; };

    namespace detail {
        template <typename Pixel, typename GpuPixel>
        struct CheckPixelLayout {
            static_assert(sizeof(GpuPixel) == Pixel::kChannels * sizeof(typename Pixel::Subpixel),
                          "host and device pixel sizes differ");
            typedef GpuPixel type;
        };

        template <typename Pixel, typename GpuPixel>
        void checkDimensions(const HostImage<Pixel> &img, const GpuImage<GpuPixel> &image) {
            if (img.width() != image.width() || img.height() != image.height()) {
                throw TransferSizeError("Host image " + std::to_string(img.width()) + "x" +
                                        std::to_string(img.height()) + " does not match device image " +
                                        std::to_string(image.width()) + "x" + std::to_string(image.height()),
                                        image.byteSize(), img.data().size() * sizeof(typename Pixel::Subpixel));
            }
        }
    } // namespace detail

    // -------- Conversions -----------------------------------------------------------
    // Device image with the integer pixel format for Pixel.
    template <typename Pixel>
    GpuImage<typename PixelMapping<Pixel>::Gpu> imageFromHost(Framework &fw, const HostImage<Pixel> &img) {
        typedef typename detail::CheckPixelLayout<Pixel, typename PixelMapping<Pixel>::Gpu>::type GpuPixel;
        return GpuImage<GpuPixel>::fromBytes(fw, img.width(), img.height(), img.bytes());
    }

    // Device image with the normalised pixel format for Pixel.
    template <typename Pixel>
    GpuImage<typename PixelMapping<Pixel>::NormGpu> normalisedImageFromHost(Framework &fw, const HostImage<Pixel> &img) {
        typedef typename detail::CheckPixelLayout<Pixel, typename PixelMapping<Pixel>::NormGpu>::type GpuPixel;
        return GpuImage<GpuPixel>::fromBytes(fw, img.width(), img.height(), img.bytes());
    }

    template <typename GpuPixel>
    Deferred<HostImage<typename HostPixelOf<GpuPixel>::type> > readToHostImageAsync(const GpuImage<GpuPixel> &image) {
        typedef typename HostPixelOf<GpuPixel>::type Pixel;
        typedef typename Pixel::Subpixel Subpixel;
        typedef typename detail::CheckPixelLayout<Pixel, GpuPixel>::type Checked;
        (void) sizeof(Checked);

        std::shared_ptr<std::promise<HostImage<Pixel> > > promise = std::make_shared<std::promise<HostImage<Pixel> > >();
        Deferred<HostImage<Pixel> > result(image.raw().framework(), promise->get_future());

        uint32_t width = image.width();
        uint32_t height = image.height();
        image.raw().downloadAsync([promise, width, height](VkResult status, const void *data, VkDeviceSize bytes) {
            if (status != VK_SUCCESS) {
                promise->set_exception(std::make_exception_ptr(
                    VulkanError(status, "Image read failed on the device", __FILE__, __LINE__)));
                return;
            }
            try {
                promise->set_value(HostImage<Pixel>(width, height,
                                                    bytesToVector<Subpixel>(data, static_cast<size_t>(bytes))));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        return result;
    }

    template <typename GpuPixel>
    HostImage<typename HostPixelOf<GpuPixel>::type> readToHostImage(const GpuImage<GpuPixel> &image) {
        return readToHostImageAsync(image).wait();
    }

    // img must have the same dimensions as image.
    template <typename Pixel, typename GpuPixel>
    Deferred<void> writeFromHostImageAsync(GpuImage<GpuPixel> &image, const HostImage<Pixel> &img) {
        typedef typename detail::CheckPixelLayout<Pixel, GpuPixel>::type Checked;
        (void) sizeof(Checked);
        detail::checkDimensions(img, image);
        return image.writeAsync(img.bytes());
    }

    template <typename Pixel, typename GpuPixel>
    void writeFromHostImage(GpuImage<GpuPixel> &image, const HostImage<Pixel> &img) {
        writeFromHostImageAsync(image, img).wait();
    }
} // namespace gpgpu

#endif // GPGPU_IMAGE_H
