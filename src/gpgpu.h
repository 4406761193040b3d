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

// gpgpu.h - Small C++11 GPU compute layer on top of Vulkan
// --------------------------------------------------------
// Design:
//  - A Framework owns instance, device, queue and limits.
//    Every resource borrows it through a FrameworkHandle and refuses to
//    work once the Framework is gone.
//  - Typed buffers/images wrap raw device-local resources; all transfers go
//    through host-visible staging buffers and the single compute queue.
//  - Async transfers return Deferred<T>. A Deferred only resolves inside
//    Framework::poll() / Framework::blockingPoll(); nothing runs in the
//    background.
//  - DescriptorSet -> KernelBuilder -> Kernel mirrors group/binding numbers
//    by insertion order; build() checks them against the SPIR-V reflection.
//
// Build: C++11, depends on <volk.h>. Define VK_NO_PROTOTYPES in your build.

#ifndef GPGPU_H
#define GPGPU_H

#include <vector>
#include <string>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <memory>
#include <functional>
#include <future>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <type_traits>

#include <volk.h>

namespace gpgpu {
    // -------- Version ------------------------------------------------------------
#define GPGPU_VERSION_MAJOR 0
#define GPGPU_VERSION_MINOR 2
#define GPGPU_VERSION_PATCH 0

    // -------- Public compile options --------------------------------------------
    // Defaults for FrameworkInfo and the logger. Override on the command line.
#ifndef GPGPU_DEFAULT_ENABLE_VALIDATION
#define GPGPU_DEFAULT_ENABLE_VALIDATION 0
#endif
#ifndef GPGPU_DEFAULT_ENABLE_DEBUG_UTILS
#define GPGPU_DEFAULT_ENABLE_DEBUG_UTILS 0
#endif
#ifndef GPGPU_DEFAULT_LOG_LEVEL
#define GPGPU_DEFAULT_LOG_LEVEL Warning
#endif

    // -------- Logging -----------------------------------------------------------
    enum class LogLevel { Debug, Info, Warning, Error, Off };

    void setLogLevel(LogLevel level);
    LogLevel logLevel();

    // printf-style; messages carry their own trailing newline.
    void gpgpu_log(LogLevel level, const char *fmt, ...);

    // -------- Exception classes ---------------------------------------------------
    class VulkanError : public std::runtime_error {
    public:
        VulkanError(VkResult result, const std::string &message, const std::string &file, int line)
            : std::runtime_error(message), result_(result), file_(file), line_(line) {}

        VkResult getResult() const { return result_; }
        const std::string &getFile() const { return file_; }
        int getLine() const { return line_; }

    private:
        VkResult result_;
        std::string file_;
        int line_;
    };

    // Kernel build failures: bad SPIR-V, unknown entry point, binding mismatch.
    class ShaderError : public std::runtime_error {
    public:
        ShaderError(const std::string &message, const std::string &entryPoint = std::string())
            : std::runtime_error(message), entryPoint_(entryPoint) {}

        const std::string &getEntryPoint() const { return entryPoint_; }

    private:
        std::string entryPoint_;
    };

    // A transfer whose byte count does not match the resource it targets.
    class TransferSizeError : public std::invalid_argument {
    public:
        TransferSizeError(const std::string &message, uint64_t expected, uint64_t actual)
            : std::invalid_argument(message), expected_(expected), actual_(actual) {}

        uint64_t expectedBytes() const { return expected_; }
        uint64_t actualBytes() const { return actual_; }

    private:
        uint64_t expected_;
        uint64_t actual_;
    };

    // -------- Small enums ---------------------------------------------------------
    enum class HostAccess { None, Write, Read, ReadWrite };

    enum class BufferUsage { Storage, Uniform, Staging };

    // Shader-side access of a storage buffer binding.
    //   ReadOnly : layout(set = 0, binding = 0) readonly buffer A { uint a[]; };
    //   ReadWrite: layout(set = 0, binding = 1) buffer C { uint c[]; };
    enum class AccessMode { ReadOnly, ReadWrite };

    // Storage images are write-only:
    //   layout(set = 0, binding = 0, rgba8ui) writeonly uniform uimage2D img;
    enum class ImageUsage { WriteOnly };

    // Access tag recorded on every descriptor binding.
    enum class BindingAccess { ReadOnly, ReadWrite, WriteOnly };

    enum class PowerPreference { HighPerformance, LowPower };

    enum class BindingKind { StorageBuffer, UniformBuffer, StorageImage, Other };

    const char *bindingKindName(BindingKind kind);

    class Framework;
    class KernelBuilder;
    class ShaderModule;

    // -------- Framework handle ------------------------------------------------------
    // Weak reference to a Framework. Resources hold one instead of a raw pointer
    // so that use after the Framework is destroyed is detected.
    class FrameworkHandle {
    public:
        FrameworkHandle() {}
        explicit FrameworkHandle(const std::shared_ptr<Framework *> &token) : token_(token) {}

        bool expired() const { return token_.expired(); }

        // Throws std::logic_error once the Framework is gone.
        Framework &get() const;
        Framework *tryGet() const;

        bool operator==(const FrameworkHandle &other) const { return tryGet() == other.tryGet(); }
        bool operator!=(const FrameworkHandle &other) const { return !(*this == other); }

    private:
        std::weak_ptr<Framework *> token_;
    };

    // -------- Deferred operation ----------------------------------------------------
    // Result of an async transfer. It never resolves on its own: the host must
    // call Framework::poll() or Framework::blockingPoll() (wait() does the latter).
    template <typename T>
    class Deferred {
    public:
        Deferred() {}
        Deferred(const FrameworkHandle &fw, std::future<T> future) : fw_(fw), future_(std::move(future)) {}

        Deferred(Deferred &&) = default;
        Deferred &operator=(Deferred &&) = default;
        Deferred(const Deferred &) = delete;
        Deferred &operator=(const Deferred &) = delete;

        bool valid() const { return future_.valid(); }

        bool isReady() const {
            return future_.valid() && future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }

        // Non-driving. Throws std::logic_error while the operation is still pending.
        T get() {
            if (!isReady()) {
                throw std::logic_error("Deferred operation is still pending; poll the Framework first");
            }
            return future_.get();
        }

        // Drives Framework::blockingPoll() until this operation resolved.
        T wait();

    private:
        FrameworkHandle fw_;
        std::future<T> future_;
    };

    // -------- Framework -------------------------------------------------------------
    struct FrameworkInfo {
        bool enableValidationLayers;               // request VK_LAYER_KHRONOS_validation
        bool enableDebugUtils;                     // request VK_EXT_debug_utils + messenger
        bool enablePortabilityEnumeration;         // list portability (MoltenVK) devices
        const char *applicationName;               // optional
        uint32_t applicationVersion;               // optional
        uint32_t apiVersion;                       // e.g. VK_API_VERSION_1_1
        int preferredIndex;                        // -1: pick by powerPreference
        PowerPreference powerPreference;
        std::vector<const char *> extraExtensions; // deduplicated internally
        std::vector<const char *> extraLayers;     // deduplicated internally

        FrameworkInfo()
            : enableValidationLayers(GPGPU_DEFAULT_ENABLE_VALIDATION != 0),
              enableDebugUtils(GPGPU_DEFAULT_ENABLE_DEBUG_UTILS != 0),
              enablePortabilityEnumeration(true),
              applicationName("gpgpu"),
              applicationVersion(1),
              apiVersion(VK_API_VERSION_1_1),
              preferredIndex(-1),
              powerPreference(PowerPreference::HighPerformance) {
        }
    };

    class Framework {
    public:
        typedef std::function<void(VkCommandBuffer)> RecordFn;
        typedef std::function<void(VkResult)> CompletionFn;

        Framework(); // defaults (no validation, high performance adapter)
        explicit Framework(const FrameworkInfo &info);
        ~Framework() noexcept;

        // Resources keep the Framework's address; it never moves.
        Framework(const Framework &) = delete;
        Framework &operator=(const Framework &) = delete;
        Framework(Framework &&) = delete;
        Framework &operator=(Framework &&) = delete;

        VkInstance instance() const { return instance_; }
        VkPhysicalDevice physical() const { return phys_; }
        VkDevice vk() const { return device_; }
        VkQueue queue() const { return queue_; }
        uint32_t queueFamilyIndex() const { return queueFamilyIndex_; }
        const VkPhysicalDeviceLimits &limits() const { return limits_; }
        const std::string &deviceName() const { return deviceName_; }
        const char *vendorName() const;
        bool validationEnabled() const { return validationEnabled_; }
        bool debugUtilsEnabled() const { return debugUtilsEnabled_; }

        FrameworkHandle handle() const { return FrameworkHandle(self_); }

        KernelBuilder createKernelBuilder(const ShaderModule &shader, const std::string &entryPoint);

        // Records a one-time command buffer and submits it to the queue. The
        // recorded commands are ordered after everything submitted earlier.
        // onComplete runs from poll()/blockingPoll() once the fence signalled.
        // It must not block on this Framework.
        void submit(const RecordFn &record, const CompletionFn &onComplete = CompletionFn());

        // Retires finished submissions and runs their completions. Returns the
        // number retired. poll() never blocks. blockingPoll() waits for every
        // in-flight submission, and for completions another thread is still
        // running, so everything submitted before the call has resolved.
        size_t poll();
        size_t blockingPoll();

        size_t pendingSubmissions() const;

        // Blocks until the device finished every in-flight submission without
        // running completions. Used before releasing device memory.
        VkResult waitForSubmissions();

        uint32_t selectMemory(uint32_t memoryTypeBits, VkMemoryPropertyFlags flags) const;

    private:
        struct Submission {
            VkFence fence;
            VkCommandBuffer cmdBuf;
            CompletionFn onComplete;
            VkResult status;
        };

        VkInstance instance_;
        VkDebugUtilsMessengerEXT debugMessenger_;
        VkPhysicalDevice phys_;
        VkDevice device_;
        VkQueue queue_;
        uint32_t queueFamilyIndex_;
        VkPhysicalDeviceLimits limits_;
        VkCommandPool cmdPool_;
        std::string deviceName_;
        uint32_t vendorId_;
        bool validationEnabled_;
        bool debugUtilsEnabled_;
        bool tornDown_;

        mutable std::mutex mutex_;
        std::condition_variable retired_;
        std::vector<Submission> inFlight_;
        size_t retiring_; // collected, completion not yet run
        std::shared_ptr<Framework *> self_;

        void createInstance(const FrameworkInfo &info);
        void createDevice(const FrameworkInfo &info);
        void collectFinished(std::vector<Submission> &done);
        size_t retire(std::vector<Submission> &done);
        void teardown() noexcept;
    };

    inline Framework &FrameworkHandle::get() const {
        Framework *fw = tryGet();
        if (!fw) {
            throw std::logic_error("Resource used after its Framework was destroyed");
        }
        return *fw;
    }

    inline Framework *FrameworkHandle::tryGet() const {
        std::shared_ptr<Framework *> token = token_.lock();
        return token ? *token : nullptr;
    }

    template <typename T>
    T Deferred<T>::wait() {
        if (!future_.valid()) {
            throw std::logic_error("Deferred::wait on an empty or already consumed operation");
        }
        while (!isReady()) {
            if (fw_.get().blockingPoll() == 0 && !isReady()) {
                throw std::logic_error("Deferred operation has no in-flight submission to wait for");
            }
        }
        return future_.get();
    }

    // -------- Byte views ------------------------------------------------------------
    // Copies a byte range into a vector of fixed-layout elements. The byte count
    // must be a whole multiple of sizeof(T).
    template <typename T>
    std::vector<T> bytesToVector(const void *bytes, size_t size) {
        static_assert(std::is_trivially_copyable<T>::value, "element type must be trivially copyable");
        if (size % sizeof(T) != 0) {
            throw TransferSizeError("Byte count " + std::to_string(size) + " is not a multiple of the element size " +
                                    std::to_string(sizeof(T)), (size / sizeof(T)) * sizeof(T), size);
        }
        std::vector<T> out(size / sizeof(T));
        if (size > 0) {
            std::memcpy(out.data(), bytes, size);
        }
        return out;
    }

    template <typename T>
    std::vector<uint8_t> vectorToBytes(const std::vector<T> &data) {
        static_assert(std::is_trivially_copyable<T>::value, "element type must be trivially copyable");
        std::vector<uint8_t> out(data.size() * sizeof(T));
        if (!out.empty()) {
            std::memcpy(out.data(), data.data(), out.size());
        }
        return out;
    }

    // Throws TransferSizeError unless actual == expected.
    void checkTransferSize(const char *operation, uint64_t expected, uint64_t actual);

    // -------- Buffer ----------------------------------------------------------------
    struct BufferInfo {
        VkDeviceSize sizeBytes;
        BufferUsage usage;
        HostAccess host;

        explicit BufferInfo(VkDeviceSize s = 0, BufferUsage u = BufferUsage::Storage, HostAccess h = HostAccess::None)
            : sizeBytes(s), usage(u), host(h) {}
    };

    class Buffer; // fwd for BufferMapping

    // RAII mapping for host-visible memory. For non-coherent memory:
    //  - mapWrite: dtor FLUSHES the aligned mapped subrange
    //  - mapRead : INVALIDATES right after mapping, dtor does nothing
    class BufferMapping {
    public:
        BufferMapping();
        ~BufferMapping() noexcept;

        BufferMapping(BufferMapping &&other) noexcept;
        BufferMapping &operator=(BufferMapping &&other) noexcept;
        BufferMapping(const BufferMapping &) = delete;
        BufferMapping &operator=(const BufferMapping &) = delete;

        void *data() const { return ptr_; }

        template <typename T>
        T *as() const { return static_cast<T *>(ptr_); }

        VkDeviceSize offsetBytes() const { return offset_; }
        VkDeviceSize lengthBytes() const { return length_; }
        bool isValid() const { return buf_ != nullptr; }

    private:
        friend class Buffer;

        BufferMapping(Buffer *b, void *p, VkDeviceSize off, VkDeviceSize len, bool w)
            : buf_(b), ptr_(p), offset_(off), length_(len), write_(w) {}

        void release() noexcept;

        Buffer *buf_;
        void *ptr_;
        VkDeviceSize offset_;
        VkDeviceSize length_;
        bool write_;
    };

    // Untyped buffer. Device-local unless created with host access, in which
    // case it is a staging buffer that can be mapped.
    class Buffer {
    public:
        // status != VK_SUCCESS means the device failed the copy; data is null then.
        typedef std::function<void(VkResult status, const void *data, VkDeviceSize bytes)> ReadbackFn;

        Buffer(Framework &fw, const BufferInfo &info);
        ~Buffer() noexcept;

        Buffer(const Buffer &) = delete;
        Buffer &operator=(const Buffer &) = delete;
        Buffer(Buffer &&) noexcept;
        Buffer &operator=(Buffer &&) noexcept;

        VkBuffer vk() const { return buffer_; }
        VkDeviceSize size() const { return size_; }
        BufferUsage usage() const { return usage_; }
        HostAccess hostAccess() const { return hostAccess_; }
        const FrameworkHandle &framework() const { return fw_; }
        // Expires when the device buffer is released.
        std::weak_ptr<bool> liveness() const { return alive_; }

        BufferMapping mapWrite(VkDeviceSize offsetBytes, VkDeviceSize lengthBytes);
        BufferMapping mapRead(VkDeviceSize offsetBytes, VkDeviceSize lengthBytes);

        // Fills the whole buffer on the device. Ordered by the queue, not waited.
        void fill(uint32_t value);

        // Copies `bytes` (== size()) into the buffer. The host data is staged
        // before returning; the Deferred resolves after the copy retired.
        Deferred<void> uploadAsync(const void *data, VkDeviceSize bytes);

        // Copies the whole buffer back; onData runs when the copy retired.
        void downloadAsync(const ReadbackFn &onData) const;

    private:
        FrameworkHandle fw_;
        VkBuffer buffer_;
        VkDeviceMemory memory_;
        VkDeviceSize size_;      // logical size
        // >= 4, Vulkan rejects empty buffers. A zero-length buffer binds these
        // 4 bytes, so a shader sees a one-element array there.
        VkDeviceSize allocSize_;
        VkMemoryPropertyFlags memFlags_;
        BufferUsage usage_;
        HostAccess hostAccess_;
        bool tornDown_;
        std::shared_ptr<bool> alive_;

        void teardown() noexcept;
        void validateRange(VkDeviceSize offset, VkDeviceSize len, const char *operation) const;
        void createVkBuffer(Framework &fw, VkBufferUsageFlags usage, VkMemoryPropertyFlags props);
        void flushRange(VkDeviceSize offset, VkDeviceSize sizeBytes);
        void invalidateRange(VkDeviceSize offset, VkDeviceSize sizeBytes);

        friend class BufferMapping;
    };

    namespace detail {
        // Readback callback that resolves `promise` with the bytes as a vector of T.
        template <typename T>
        Buffer::ReadbackFn resolveWith(const std::shared_ptr<std::promise<std::vector<T> > > &promise,
                                       const char *operation) {
            return [promise, operation](VkResult status, const void *data, VkDeviceSize bytes) {
                if (status != VK_SUCCESS) {
                    promise->set_exception(std::make_exception_ptr(
                        VulkanError(status, std::string(operation) + " failed on the device", __FILE__, __LINE__)));
                    return;
                }
                try {
                    promise->set_value(bytesToVector<T>(data, static_cast<size_t>(bytes)));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            };
        }

        VkDeviceSize checkedByteSize(size_t count, size_t elementSize);
        void checkUniformRange(Framework &fw, VkDeviceSize bytes);
    } // namespace detail

    // -------- Typed buffers -----------------------------------------------------------
    // Contiguous device array of T. Use through the GpuBuffer / GpuUniformBuffer aliases.
    template <typename T, BufferUsage Usage>
    class TypedBuffer {
        static_assert(std::is_trivially_copyable<T>::value, "buffer element type must be trivially copyable");

    public:
        // Zero-filled buffer of `length` elements.
        TypedBuffer(Framework &fw, size_t length)
            : buffer_(fw, BufferInfo(byteSizeFor(fw, length), Usage, HostAccess::None)), length_(length) {
            buffer_.fill(0);
        }

        // Buffer holding a copy of data; the upload has finished when this returns.
        static TypedBuffer fromSlice(Framework &fw, const T *data, size_t count) {
            TypedBuffer buf(fw, count, Uninitialized());
            buf.writeBytes(data, count * sizeof(T));
            return buf;
        }

        static TypedBuffer fromSlice(Framework &fw, const std::vector<T> &data) {
            return fromSlice(fw, data.data(), data.size());
        }

        size_t length() const { return length_; }
        VkDeviceSize byteSize() const { return buffer_.size(); }
        const Buffer &raw() const { return buffer_; }
        Buffer &raw() { return buffer_; }

        // Blocking read of the whole buffer.
        std::vector<T> read() const { return readAsync().wait(); }

        // Resolves on a later Framework::poll() / blockingPoll().
        Deferred<std::vector<T> > readAsync() const {
            std::shared_ptr<std::promise<std::vector<T> > > promise =
                std::make_shared<std::promise<std::vector<T> > >();
            Deferred<std::vector<T> > result(buffer_.framework(), promise->get_future());
            buffer_.downloadAsync(detail::resolveWith<T>(promise, "Buffer read"));
            return result;
        }

        void write(const std::vector<T> &data) { writeAsync(data).wait(); }

        Deferred<void> writeAsync(const std::vector<T> &data) {
            return writeBytesAsync(data.data(), data.size() * sizeof(T));
        }

        // Byte count must equal byteSize().
        void writeBytes(const void *bytes, size_t count) { writeBytesAsync(bytes, count).wait(); }

        Deferred<void> writeBytesAsync(const void *bytes, size_t count) {
            return buffer_.uploadAsync(bytes, count);
        }

    private:
        struct Uninitialized {};

        TypedBuffer(Framework &fw, size_t length, Uninitialized)
            : buffer_(fw, BufferInfo(byteSizeFor(fw, length), Usage, HostAccess::None)), length_(length) {}

        static VkDeviceSize byteSizeFor(Framework &fw, size_t length) {
            VkDeviceSize bytes = detail::checkedByteSize(length, sizeof(T));
            if (Usage == BufferUsage::Uniform) {
                detail::checkUniformRange(fw, bytes);
            }
            return bytes;
        }

        Buffer buffer_;
        size_t length_;
    };

    // General read/write storage buffer.
    template <typename T>
    using GpuBuffer = TypedBuffer<T, BufferUsage::Storage>;

    // Small read-only buffer, bound as a uniform block.
    template <typename T>
    using GpuUniformBuffer = TypedBuffer<T, BufferUsage::Uniform>;

    // -------- Pixels ----------------------------------------------------------------
    namespace pixels {
        struct Rgba8Uint {
            uint8_t r, g, b, a;
            static VkFormat format() { return VK_FORMAT_R8G8B8A8_UINT; }
            static const char *name() { return "Rgba8Uint"; }
        };

        struct Rgba8UintNorm {
            uint8_t r, g, b, a;
            static VkFormat format() { return VK_FORMAT_R8G8B8A8_UNORM; }
            static const char *name() { return "Rgba8UintNorm"; }
        };

        struct Rgba8Sint {
            int8_t r, g, b, a;
            static VkFormat format() { return VK_FORMAT_R8G8B8A8_SINT; }
            static const char *name() { return "Rgba8Sint"; }
        };

        struct Rgba8SintNorm {
            int8_t r, g, b, a;
            static VkFormat format() { return VK_FORMAT_R8G8B8A8_SNORM; }
            static const char *name() { return "Rgba8SintNorm"; }
        };

        struct Luma8 {
            uint8_t l;
            static VkFormat format() { return VK_FORMAT_R8_UINT; }
            static const char *name() { return "Luma8"; }
        };

        struct Luma8Norm {
            uint8_t l;
            static VkFormat format() { return VK_FORMAT_R8_UNORM; }
            static const char *name() { return "Luma8Norm"; }
        };
    } // namespace pixels

    // -------- Image -----------------------------------------------------------------
    struct ImageInfo {
        uint32_t width;
        uint32_t height;
        VkFormat format;
        uint32_t pixelBytes;

        ImageInfo(uint32_t w = 0, uint32_t h = 0, VkFormat f = VK_FORMAT_UNDEFINED, uint32_t pb = 0)
            : width(w), height(h), format(f), pixelBytes(pb) {}
    };

    // Untyped 2D storage image. Lives in VK_IMAGE_LAYOUT_GENERAL.
    class Image {
    public:
        Image(Framework &fw, const ImageInfo &info);
        ~Image() noexcept;

        Image(const Image &) = delete;
        Image &operator=(const Image &) = delete;
        Image(Image &&) noexcept;
        Image &operator=(Image &&) noexcept;

        VkImage vk() const { return image_; }
        VkImageView view() const { return view_; }
        VkFormat format() const { return format_; }
        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }
        VkExtent3D extent() const;
        // width * height * pixelBytes, rows tightly packed
        VkDeviceSize size() const;
        const FrameworkHandle &framework() const { return fw_; }
        std::weak_ptr<bool> liveness() const { return alive_; }

        void clear();
        Deferred<void> uploadAsync(const void *data, VkDeviceSize bytes);
        void downloadAsync(const Buffer::ReadbackFn &onData) const;

    private:
        FrameworkHandle fw_;
        VkImage image_;
        VkDeviceMemory memory_;
        VkImageView view_;
        VkFormat format_;
        uint32_t width_;
        uint32_t height_;
        uint32_t pixelBytes_;
        bool tornDown_;
        std::shared_ptr<bool> alive_;

        void teardown() noexcept;
    };

    // 2D image of P pixels.
    template <typename P>
    class GpuImage {
        static_assert(std::is_trivially_copyable<P>::value, "pixel type must be trivially copyable");

    public:
        typedef P Pixel;

        // Image cleared to zero.
        GpuImage(Framework &fw, uint32_t width, uint32_t height)
            : image_(fw, ImageInfo(width, height, P::format(), sizeof(P))) {
            image_.clear();
        }

        // Image holding a copy of bytes (width * height * sizeof(P)).
        static GpuImage fromBytes(Framework &fw, uint32_t width, uint32_t height, const std::vector<uint8_t> &bytes) {
            GpuImage img(fw, width, height, Uninitialized());
            img.write(bytes);
            return img;
        }

        uint32_t width() const { return image_.width(); }
        uint32_t height() const { return image_.height(); }
        VkDeviceSize byteSize() const { return image_.size(); }
        const Image &raw() const { return image_; }
        Image &raw() { return image_; }

        // Blocking read; row-major, tightly packed.
        std::vector<uint8_t> read() const { return readAsync().wait(); }

        Deferred<std::vector<uint8_t> > readAsync() const {
            std::shared_ptr<std::promise<std::vector<uint8_t> > > promise =
                std::make_shared<std::promise<std::vector<uint8_t> > >();
            Deferred<std::vector<uint8_t> > result(image_.framework(), promise->get_future());
            image_.downloadAsync(detail::resolveWith<uint8_t>(promise, "Image read"));
            return result;
        }

        void write(const std::vector<uint8_t> &bytes) { writeAsync(bytes).wait(); }

        Deferred<void> writeAsync(const std::vector<uint8_t> &bytes) {
            return image_.uploadAsync(bytes.data(), bytes.size());
        }

        void writeBytes(const void *bytes, size_t count) { image_.uploadAsync(bytes, count).wait(); }

        Deferred<void> writeBytesAsync(const void *bytes, size_t count) {
            return image_.uploadAsync(bytes, count);
        }

    private:
        struct Uninitialized {};

        GpuImage(Framework &fw, uint32_t width, uint32_t height, Uninitialized)
            : image_(fw, ImageInfo(width, height, P::format(), sizeof(P))) {}

        Image image_;
    };

    // -------- Shader module -----------------------------------------------------------
    struct ShaderEntryPoint {
        std::string name;
        uint32_t executionModel;
        std::vector<uint32_t> interfaceIds;
    };

    struct ShaderResource {
        uint32_t id;
        uint32_t set;
        uint32_t binding;
        BindingKind kind;
        // Declared access. NonReadable / NonWritable on the variable, or on
        // every member of its block, clear these.
        bool readable;
        bool writable;
    };

    // Entry points and descriptor bindings declared by a SPIR-V module.
    class ShaderReflection {
    public:
        static const uint32_t kExecutionModelGLCompute = 5;

        ShaderReflection() : version_(0) {}

        // Throws ShaderError on malformed input.
        static ShaderReflection parse(const std::vector<uint32_t> &spirv);

        // Header version word, e.g. 0x00010300 for SPIR-V 1.3.
        uint32_t version() const { return version_; }
        const std::vector<ShaderEntryPoint> &entryPoints() const { return entryPoints_; }
        // Sorted by (set, binding).
        const std::vector<ShaderResource> &resources() const { return resources_; }

        const ShaderEntryPoint *findEntryPoint(const std::string &name,
                                               uint32_t executionModel = kExecutionModelGLCompute) const;

        // Before SPIR-V 1.4 the interface list only names Input/Output
        // variables, so every resource of the module is reported.
        std::vector<ShaderResource> resourcesUsedBy(const ShaderEntryPoint &entry) const;

    private:
        uint32_t version_;
        std::vector<ShaderEntryPoint> entryPoints_;
        std::vector<ShaderResource> resources_;
    };

    class ShaderModule {
    public:
        ShaderModule(Framework &fw, const std::vector<uint32_t> &spirv);
        ~ShaderModule() noexcept;

        ShaderModule(const ShaderModule &) = delete;
        ShaderModule &operator=(const ShaderModule &) = delete;
        ShaderModule(ShaderModule &&) noexcept;
        ShaderModule &operator=(ShaderModule &&) noexcept;

        static ShaderModule fromSpirv(Framework &fw, const std::vector<uint32_t> &spirv);
        static ShaderModule fromSpirvFile(Framework &fw, const std::string &path);

        VkShaderModule vk() const { return module_; }
        const ShaderReflection &reflection() const { return reflection_; }
        const FrameworkHandle &framework() const { return fw_; }
        std::weak_ptr<bool> liveness() const { return alive_; }

    private:
        FrameworkHandle fw_;
        VkShaderModule module_;
        ShaderReflection reflection_;
        std::shared_ptr<bool> alive_;

        void teardown() noexcept;
    };

    // -------- Descriptor set ----------------------------------------------------------
    struct DescriptorBinding {
        VkDescriptorType type;
        BindingAccess access;
        VkDescriptorBufferInfo buffer; // buffer bindings
        VkDescriptorImageInfo image;   // image bindings
        VkDeviceSize byteSize;
        FrameworkHandle framework;
        std::weak_ptr<bool> resource; // expires with the bound buffer or image
    };

    // Ordered bindings of one shader group. Binding N is the N-th append.
    class DescriptorSet {
    public:
        template <typename T>
        DescriptorSet &bindBuffer(const GpuBuffer<T> &buffer, AccessMode access) {
            return appendBuffer(buffer.raw(), VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                access == AccessMode::ReadOnly ? BindingAccess::ReadOnly : BindingAccess::ReadWrite);
        }

        template <typename T>
        DescriptorSet &bindUniformBuffer(const GpuUniformBuffer<T> &buffer) {
            return appendBuffer(buffer.raw(), VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, BindingAccess::ReadOnly);
        }

        template <typename P>
        DescriptorSet &bindImage(const GpuImage<P> &image, ImageUsage usage = ImageUsage::WriteOnly) {
            (void) usage; // WriteOnly is the only storage image mode
            return appendImage(image.raw(), BindingAccess::WriteOnly);
        }

        const std::vector<VkDescriptorSetLayoutBinding> &layoutEntries() const { return layout_; }
        const std::vector<DescriptorBinding> &bindings() const { return binds_; }
        size_t size() const { return binds_.size(); }
        bool empty() const { return binds_.empty(); }

    private:
        std::vector<VkDescriptorSetLayoutBinding> layout_;
        std::vector<DescriptorBinding> binds_;

        DescriptorSet &appendBuffer(const Buffer &buffer, VkDescriptorType type, BindingAccess access);
        DescriptorSet &appendImage(const Image &image, BindingAccess access);
    };

    // -------- Kernel ------------------------------------------------------------------
    // Compiled pipeline with fixed bind groups. Enqueue-only.
    class Kernel {
    public:
        ~Kernel() noexcept;

        Kernel(const Kernel &) = delete;
        Kernel &operator=(const Kernel &) = delete;
        Kernel(Kernel &&) noexcept;
        Kernel &operator=(Kernel &&) noexcept;

        // Submits a dispatch of x * y * z workgroups and returns immediately.
        // Throws std::logic_error if a bound resource was destroyed.
        void enqueue(uint32_t x, uint32_t y = 1, uint32_t z = 1);

        const std::string &entryPoint() const { return entryPoint_; }
        VkPipeline pipeline() const { return pipeline_; }
        VkPipelineLayout pipelineLayout() const { return layout_; }
        const std::vector<VkDescriptorSetLayout> &setLayouts() const { return setLayouts_; }
        size_t bindGroupCount() const { return setLayouts_.size(); }

    private:
        friend class KernelBuilder;

        Kernel(Framework &fw, const std::string &entryPoint);

        FrameworkHandle fw_;
        std::vector<VkDescriptorSetLayout> setLayouts_;
        VkPipelineLayout layout_;
        VkPipeline pipeline_;
        VkDescriptorPool pool_;
        std::vector<VkDescriptorSet> sets_;
        std::vector<std::weak_ptr<bool> > resources_;
        std::string entryPoint_;
        bool tornDown_;

        void teardown() noexcept;
    };

    // Collects descriptor sets for one entry point. Group N is the N-th set
    // added. Single use: build() consumes the builder. build() throws
    // std::logic_error if the Framework or the shader module is gone.
    class KernelBuilder {
    public:
        KernelBuilder(Framework &fw, const ShaderModule &shader, const std::string &entryPoint);

        KernelBuilder &addDescriptorSet(const DescriptorSet &set);

        Kernel build();

        const std::string &entryPoint() const { return entryPoint_; }
        size_t descriptorSetCount() const { return sets_.size(); }
        bool isBuilt() const { return built_; }

    private:
        FrameworkHandle fw_;
        VkShaderModule module_;
        ShaderReflection reflection_;
        std::weak_ptr<bool> shaderAlive_;
        std::string entryPoint_;
        std::vector<DescriptorSet> sets_;
        bool built_;

        void validateBindings(Framework &fw) const;
        void validateAgainstShader() const;
    };

    // -------- Utility functions -------------------------------------------------
    void vkCheck(VkResult result, const char *file, int line);
    const char *vkResultString(VkResult result);
    const char *vkDeviceType(VkPhysicalDeviceType type);
    const char *vkVendorName(uint32_t vendorId);

    bool isValidSPIRV(const std::vector<uint32_t> &code);
    std::vector<uint32_t> readSpirv(const std::string &filename);

    // Alignment utilities
    VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment);
    VkDeviceSize alignDown(VkDeviceSize value, VkDeviceSize alignment);
} // namespace gpgpu

// Macro for error checking
#define GPGPU_VK_CHECK(result) gpgpu::vkCheck((result), __FILE__, __LINE__)

#endif // GPGPU_H
