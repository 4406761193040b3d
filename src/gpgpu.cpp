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

#include "gpgpu.h"

#include <cstring>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <set>
#include <limits>

#ifdef __ANDROID__
#include <android/log.h>
#endif

namespace gpgpu {
    // -------- Logging -----------------------------------------------------------
    static std::atomic<int> g_logLevel(static_cast<int>(LogLevel::GPGPU_DEFAULT_LOG_LEVEL));

    void setLogLevel(LogLevel level) {
        g_logLevel.store(static_cast<int>(level));
    }

    LogLevel logLevel() {
        return static_cast<LogLevel>(g_logLevel.load());
    }

    void gpgpu_log(LogLevel level, const char *fmt, ...) {
        if (level == LogLevel::Off || static_cast<int>(level) < g_logLevel.load()) return;

        va_list args;
        va_start(args, fmt);
#ifdef __ANDROID__
        int prio = ANDROID_LOG_INFO;
        switch (level) {
        case LogLevel::Debug: prio = ANDROID_LOG_DEBUG; break;
        case LogLevel::Warning: prio = ANDROID_LOG_WARN; break;
        case LogLevel::Error: prio = ANDROID_LOG_ERROR; break;
        default: break;
        }
        __android_log_vprint(prio, "gpgpu", fmt, args);
#else
        FILE *out = level >= LogLevel::Warning ? stderr : stdout;
        vfprintf(out, fmt, args);
#endif
        va_end(args);
    }

    // -------- VkResult to string conversion -------------------------------------
    const char *vkResultString(VkResult res) {
        switch (res) {
        // 1.0
        case VK_SUCCESS: return "VK_SUCCESS";
        case VK_NOT_READY: return "VK_NOT_READY";
        case VK_TIMEOUT: return "VK_TIMEOUT";
        case VK_EVENT_SET: return "VK_EVENT_SET";
        case VK_EVENT_RESET: return "VK_EVENT_RESET";
        case VK_INCOMPLETE: return "VK_INCOMPLETE";
        case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
        case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
        case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
        case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
        case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
        case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
        case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
        case VK_ERROR_FRAGMENTED_POOL: return "VK_ERROR_FRAGMENTED_POOL";
        case VK_ERROR_UNKNOWN: return "VK_ERROR_UNKNOWN";
        // 1.1
        case VK_ERROR_OUT_OF_POOL_MEMORY: return "VK_ERROR_OUT_OF_POOL_MEMORY";
        case VK_ERROR_INVALID_EXTERNAL_HANDLE: return "VK_ERROR_INVALID_EXTERNAL_HANDLE";
        // 1.2
        case VK_ERROR_FRAGMENTATION: return "VK_ERROR_FRAGMENTATION";
        case VK_ERROR_INVALID_OPAQUE_CAPTURE_ADDRESS: return "VK_ERROR_INVALID_OPAQUE_CAPTURE_ADDRESS";
        default: return "UNKNOWN_ERROR";
        }
    }

    const char *vkVendorName(uint32_t vid) {
        switch (vid) {
        case 0x10DE: return "NVIDIA";
        case 0x1002: return "AMD";
        case 0x8086: return "Intel";
        case 0x106B: return "Apple";
        case 0x13B5: return "ARM";
        case 0x5143: return "Qualcomm";
        case 0x10005: return "Mesa";
        default: return "UNKNOWN";
        }
    }

    const char *vkDeviceType(VkPhysicalDeviceType type) {
        switch (type) {
        case VK_PHYSICAL_DEVICE_TYPE_OTHER: return "VK_PHYSICAL_DEVICE_TYPE_OTHER";
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return "VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU";
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return "VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU";
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return "VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU";
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return "VK_PHYSICAL_DEVICE_TYPE_CPU";
        default: return "UNKNOWN_DEVICE_TYPE";
        }
    }

    const char *bindingKindName(BindingKind kind) {
        switch (kind) {
        case BindingKind::StorageBuffer: return "storage buffer";
        case BindingKind::UniformBuffer: return "uniform buffer";
        case BindingKind::StorageImage: return "storage image";
        default: return "unsupported resource";
        }
    }

    // -------- Error handling utilities ------------------------------------------
    void vkCheck(VkResult result, const char *file, int line) {
        if (result != VK_SUCCESS) {
            std::string message = "Vulkan error: " + std::string(vkResultString(result));
            throw VulkanError(result, message, file, line);
        }
    }

    void checkTransferSize(const char *operation, uint64_t expected, uint64_t actual) {
        if (expected != actual) {
            throw TransferSizeError(std::string(operation) + ": expected " + std::to_string(expected) +
                                    " bytes, got " + std::to_string(actual), expected, actual);
        }
    }

    namespace detail {
        VkDeviceSize checkedByteSize(size_t count, size_t elementSize) {
            if (elementSize != 0 && count > std::numeric_limits<VkDeviceSize>::max() / 2 / elementSize) {
                throw std::length_error("Buffer of " + std::to_string(count) + " elements is too large");
            }
            return static_cast<VkDeviceSize>(count) * elementSize;
        }

        void checkUniformRange(Framework &fw, VkDeviceSize bytes) {
            if (bytes > fw.limits().maxUniformBufferRange) {
                throw std::invalid_argument("Uniform buffer of " + std::to_string(bytes) +
                                            " bytes exceeds maxUniformBufferRange (" +
                                            std::to_string(fw.limits().maxUniformBufferRange) + ")");
            }
        }
    } // namespace detail

    // -------- Alignment utilities -----------------------------------------------
    VkDeviceSize alignDown(VkDeviceSize value, VkDeviceSize alignment) {
        if (alignment == 0 || alignment == 1) return value;
        return (value / alignment) * alignment;
    }

    VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
        if (alignment == 0 || alignment == 1) return value;

        // Check for overflow: if value > UINT64_MAX - alignment + 1, we'd overflow
        if (value > std::numeric_limits<VkDeviceSize>::max() - alignment + 1) {
            return std::numeric_limits<VkDeviceSize>::max();
        }

        return ((value + alignment - 1) / alignment) * alignment;
    }

    // -------- Debug callback ----------------------------------------------------
    static VKAPI_ATTR VkBool32 VKAPI_CALL debugUtilsCallback(
        VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
        VkDebugUtilsMessageTypeFlagsEXT messageTypes,
        const VkDebugUtilsMessengerCallbackDataEXT *pCallbackData,
        void *pUserData) {
        (void) messageTypes;
        (void) pUserData;
        LogLevel level = LogLevel::Info;
        if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
            level = LogLevel::Error;
        } else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
            level = LogLevel::Warning;
        }
        gpgpu_log(level, "[Vulkan:%s] %s\n",
                  pCallbackData->pMessageIdName ? pCallbackData->pMessageIdName : "?",
                  pCallbackData->pMessage ? pCallbackData->pMessage : "");
        return VK_FALSE;
    }

    // -------- SPIR-V validation -------------------------------------------------
    bool isValidSPIRV(const std::vector<uint32_t> &code) {
        // Header is five words: magic, version, generator, bound, schema
        return code.size() >= 5 && code[0] == 0x07230203u;
    }

    // -------- Framework implementation ------------------------------------------
    // Prefers a compute family without graphics; UINT32_MAX if there is none.
    static uint32_t findComputeQueueFamily(VkPhysicalDevice physicalDevice) {
        if (physicalDevice == VK_NULL_HANDLE) return UINT32_MAX;

        uint32_t count = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(physicalDevice, &count, nullptr);
        std::vector<VkQueueFamilyProperties> families(count);
        vkGetPhysicalDeviceQueueFamilyProperties(physicalDevice, &count, families.data());

        uint32_t anyCompute = UINT32_MAX;
        for (uint32_t i = 0; i < count; ++i) {
            const VkQueueFamilyProperties &family = families[i];
            if (family.queueCount == 0 || !(family.queueFlags & VK_QUEUE_COMPUTE_BIT)) continue;
            if (!(family.queueFlags & VK_QUEUE_GRAPHICS_BIT)) return i;
            if (anyCompute == UINT32_MAX) anyCompute = i;
        }
        return anyCompute;
    }

    static int deviceScore(VkPhysicalDeviceType type, PowerPreference preference) {
        switch (type) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
            return preference == PowerPreference::HighPerformance ? 4 : 3;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
            return preference == PowerPreference::HighPerformance ? 3 : 4;
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return 2;
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return 1;
        default: return 0;
        }
    }

    static VkPhysicalDevice selectBestDevice(const std::vector<VkPhysicalDevice> &devices, int preferredIndex,
                                             PowerPreference preference) {
        if (devices.empty()) {
            throw std::runtime_error("No Vulkan physical devices available");
        }

        if (preferredIndex >= 0 && preferredIndex < static_cast<int>(devices.size())) {
            VkPhysicalDevice candidate = devices[preferredIndex];
            if (findComputeQueueFamily(candidate) != UINT32_MAX) {
                return candidate;
            }
            gpgpu_log(LogLevel::Warning, "gpgpu: device %d has no compute queue, picking another\n", preferredIndex);
        }

        VkPhysicalDevice bestDevice = VK_NULL_HANDLE;
        int bestScore = -1;

        for (VkPhysicalDevice device : devices) {
            if (findComputeQueueFamily(device) == UINT32_MAX) {
                continue; // No compute queue
            }

            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(device, &props);

            int score = deviceScore(props.deviceType, preference);
            if (score > bestScore) {
                bestScore = score;
                bestDevice = device;
            }
        }

        return bestDevice;
    }

    static void dedupCStrs(std::vector<const char *> &v) {
        std::vector<const char *> out;
        for (const char *s : v) {
            if (!s) continue;
            bool seen = false;
            for (const char *t : out) {
                if (std::strcmp(s, t) == 0) {
                    seen = true;
                    break;
                }
            }
            if (!seen) out.push_back(s);
        }
        v.swap(out);
    }

    Framework::Framework() : Framework(FrameworkInfo()) {}

    Framework::Framework(const FrameworkInfo &info)
        : instance_(VK_NULL_HANDLE),
          debugMessenger_(VK_NULL_HANDLE),
          phys_(VK_NULL_HANDLE),
          device_(VK_NULL_HANDLE),
          queue_(VK_NULL_HANDLE),
          queueFamilyIndex_(UINT32_MAX),
          limits_(),
          cmdPool_(VK_NULL_HANDLE),
          vendorId_(0),
          validationEnabled_(info.enableValidationLayers),
          debugUtilsEnabled_(info.enableDebugUtils),
          tornDown_(false),
          retiring_(0) {
        try {
            createInstance(info);
            createDevice(info);
        } catch (...) {
            teardown();
            throw;
        }
        self_ = std::make_shared<Framework *>(this);
        gpgpu_log(LogLevel::Info, "gpgpu: using %s (%s), compute queue family %u\n",
                  deviceName_.c_str(), vendorName(), queueFamilyIndex_);
    }

    Framework::~Framework() noexcept {
        if (!tornDown_) {
            teardown();
        }
    }

    void Framework::createInstance(const FrameworkInfo &info) {
        // Load global Vulkan entry points (required before any vk* global calls)
        VkResult volkResult = volkInitialize();
        if (volkResult != VK_SUCCESS) {
            throw VulkanError(volkResult, "Failed to initialize Volk: no Vulkan loader found", __FILE__, __LINE__);
        }

        std::vector<const char *> enabledLayers;
        std::vector<const char *> enabledExtensions;

        if (validationEnabled_) {
            uint32_t layerCount = 0;
            GPGPU_VK_CHECK(vkEnumerateInstanceLayerProperties(&layerCount, nullptr));
            std::vector<VkLayerProperties> availableLayers(layerCount);
            GPGPU_VK_CHECK(vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data()));

            bool hasValidationLayer = false;
            for (const auto &layer : availableLayers) {
                if (strcmp(layer.layerName, "VK_LAYER_KHRONOS_validation") == 0) {
                    hasValidationLayer = true;
                    break;
                }
            }
            if (hasValidationLayer) {
                enabledLayers.push_back("VK_LAYER_KHRONOS_validation");
            } else {
                gpgpu_log(LogLevel::Warning, "gpgpu: VK_LAYER_KHRONOS_validation not available\n");
                validationEnabled_ = false;
            }
        }

        uint32_t extensionCount = 0;
        GPGPU_VK_CHECK(vkEnumerateInstanceExtensionProperties(nullptr, &extensionCount, nullptr));
        std::vector<VkExtensionProperties> availableExtensions(extensionCount);
        GPGPU_VK_CHECK(vkEnumerateInstanceExtensionProperties(nullptr, &extensionCount, availableExtensions.data()));

        bool hasDebugUtils = false;
        bool hasPortabilityEnum = false;
        for (const auto &ext : availableExtensions) {
            if (strcmp(ext.extensionName, VK_EXT_DEBUG_UTILS_EXTENSION_NAME) == 0) {
                hasDebugUtils = true;
            } else if (strcmp(ext.extensionName, "VK_KHR_portability_enumeration") == 0) {
                hasPortabilityEnum = true;
            }
        }

        if (debugUtilsEnabled_) {
            if (hasDebugUtils) {
                enabledExtensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            } else {
                gpgpu_log(LogLevel::Warning, "gpgpu: VK_EXT_debug_utils not available\n");
                debugUtilsEnabled_ = false;
            }
        }

        for (const char *ext : info.extraExtensions) {
            if (ext) enabledExtensions.push_back(ext);
        }
        for (const char *layer : info.extraLayers) {
            if (layer) enabledLayers.push_back(layer);
        }

        VkInstanceCreateFlags instanceCreateFlags = 0;
        if (info.enablePortabilityEnumeration && hasPortabilityEnum) {
            enabledExtensions.push_back("VK_KHR_portability_enumeration");
            instanceCreateFlags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
        }

        dedupCStrs(enabledExtensions);
        dedupCStrs(enabledLayers);

        VkApplicationInfo appInfo{
            VK_STRUCTURE_TYPE_APPLICATION_INFO,
            nullptr,
            info.applicationName,
            info.applicationVersion,
            "gpgpu",
            GPGPU_VERSION_MAJOR * 10000 + GPGPU_VERSION_MINOR * 100 + GPGPU_VERSION_PATCH,
            info.apiVersion
        };

        // Chained into instance creation so create/destroy messages are reported too
        VkDebugUtilsMessengerCreateInfoEXT debugUtilsCreateInfo{};
        if (debugUtilsEnabled_) {
            debugUtilsCreateInfo = {
                VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT,
                nullptr,
                0,
                VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT,
                VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT,
                debugUtilsCallback,
                nullptr
            };
        }

        VkInstanceCreateInfo createInfo{
            VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
            debugUtilsEnabled_ ? &debugUtilsCreateInfo : nullptr,
            instanceCreateFlags,
            &appInfo,
            static_cast<uint32_t>(enabledLayers.size()),
            enabledLayers.data(),
            static_cast<uint32_t>(enabledExtensions.size()),
            enabledExtensions.data()
        };

        GPGPU_VK_CHECK(vkCreateInstance(&createInfo, nullptr, &instance_));

        // Load instance-scoped entry points (EXT loader functions included)
        volkLoadInstance(instance_);

        if (debugUtilsEnabled_) {
            GPGPU_VK_CHECK(vkCreateDebugUtilsMessengerEXT(instance_, &debugUtilsCreateInfo, nullptr, &debugMessenger_));
        }
    }

    void Framework::createDevice(const FrameworkInfo &info) {
        // 1. Select a physical device
        uint32_t deviceCount = 0;
        GPGPU_VK_CHECK(vkEnumeratePhysicalDevices(instance_, &deviceCount, nullptr));
        std::vector<VkPhysicalDevice> devices(deviceCount);
        if (deviceCount > 0) {
            GPGPU_VK_CHECK(vkEnumeratePhysicalDevices(instance_, &deviceCount, devices.data()));
        }

        phys_ = selectBestDevice(devices, info.preferredIndex, info.powerPreference);
        if (phys_ == VK_NULL_HANDLE) {
            throw std::runtime_error("No Vulkan device with a compute queue found");
        }

        // 2. Queue family and properties
        queueFamilyIndex_ = findComputeQueueFamily(phys_);

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(phys_, &props);
        limits_ = props.limits;
        deviceName_ = props.deviceName;
        vendorId_ = props.vendorID;
        gpgpu_log(LogLevel::Debug, "gpgpu: selected %s (%s)\n", props.deviceName, vkDeviceType(props.deviceType));

        // 3. Device extensions
        uint32_t deviceExtensionCount = 0;
        GPGPU_VK_CHECK(vkEnumerateDeviceExtensionProperties(phys_, nullptr, &deviceExtensionCount, nullptr));
        std::vector<VkExtensionProperties> extensions(deviceExtensionCount);
        GPGPU_VK_CHECK(vkEnumerateDeviceExtensionProperties(phys_, nullptr, &deviceExtensionCount, extensions.data()));

        std::vector<const char *> enabledExtensions;
        for (const auto &extension : extensions) {
            if (strcmp(extension.extensionName, "VK_KHR_portability_subset") == 0) {
                // Must be enabled whenever the device advertises it
                enabledExtensions.push_back("VK_KHR_portability_subset");
            }
        }

        // 4. One compute queue
        float priority = 1.0f;
        VkDeviceQueueCreateInfo computeQueueInfo{
            VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
            nullptr,
            0,
            queueFamilyIndex_,
            1,
            &priority
        };

        VkPhysicalDeviceFeatures deviceFeatures{};

        VkDeviceCreateInfo deviceCreateInfo{
            VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
            nullptr,
            0,
            1,
            &computeQueueInfo,
            0,
            nullptr,
            static_cast<uint32_t>(enabledExtensions.size()),
            enabledExtensions.data(),
            &deviceFeatures
        };

        GPGPU_VK_CHECK(vkCreateDevice(phys_, &deviceCreateInfo, nullptr, &device_));

        // 5. Queue and command pool. Device calls go through the loader
        // trampolines from volkLoadInstance, valid for every Framework's device.
        vkGetDeviceQueue(device_, queueFamilyIndex_, 0, &queue_);

        VkCommandPoolCreateInfo poolInfo{
            VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
            nullptr,
            VK_COMMAND_POOL_CREATE_TRANSIENT_BIT | VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT,
            queueFamilyIndex_
        };
        GPGPU_VK_CHECK(vkCreateCommandPool(device_, &poolInfo, nullptr, &cmdPool_));
    }

    const char *Framework::vendorName() const {
        return vkVendorName(vendorId_);
    }

    KernelBuilder Framework::createKernelBuilder(const ShaderModule &shader, const std::string &entryPoint) {
        return KernelBuilder(*this, shader, entryPoint);
    }

    uint32_t Framework::selectMemory(uint32_t memoryTypeBits, VkMemoryPropertyFlags flags) const {
        VkPhysicalDeviceMemoryProperties memProperties;
        vkGetPhysicalDeviceMemoryProperties(phys_, &memProperties);

        for (uint32_t i = 0; i < memProperties.memoryTypeCount; i++) {
            if ((memoryTypeBits & (1u << i)) &&
                ((flags & memProperties.memoryTypes[i].propertyFlags) == flags)) {
                return i;
            }
        }
        throw std::runtime_error("Failed to find suitable memory type");
    }

    void Framework::submit(const RecordFn &record, const CompletionFn &onComplete) {
        std::lock_guard<std::mutex> lock(mutex_);

        VkCommandBufferAllocateInfo allocInfo{
            VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
            nullptr,
            cmdPool_,
            VK_COMMAND_BUFFER_LEVEL_PRIMARY,
            1
        };
        VkCommandBuffer cmdBuf = VK_NULL_HANDLE;
        GPGPU_VK_CHECK(vkAllocateCommandBuffers(device_, &allocInfo, &cmdBuf));

        VkFence fence = VK_NULL_HANDLE;
        try {
            VkCommandBufferBeginInfo beginInfo{
                VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
                nullptr,
                VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
                nullptr
            };
            GPGPU_VK_CHECK(vkBeginCommandBuffer(cmdBuf, &beginInfo));

            // Queue-order this submission after all earlier transfers and dispatches
            VkMemoryBarrier ordering{
                VK_STRUCTURE_TYPE_MEMORY_BARRIER,
                nullptr,
                VK_ACCESS_MEMORY_WRITE_BIT,
                VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT
            };
            vkCmdPipelineBarrier(cmdBuf, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                                 0, 1, &ordering, 0, nullptr, 0, nullptr);

            record(cmdBuf);

            GPGPU_VK_CHECK(vkEndCommandBuffer(cmdBuf));

            VkFenceCreateInfo fenceInfo{VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, nullptr, 0};
            GPGPU_VK_CHECK(vkCreateFence(device_, &fenceInfo, nullptr, &fence));

            VkSubmitInfo submitInfo{
                VK_STRUCTURE_TYPE_SUBMIT_INFO,
                nullptr,
                0, nullptr, nullptr,
                1, &cmdBuf,
                0, nullptr
            };
            GPGPU_VK_CHECK(vkQueueSubmit(queue_, 1, &submitInfo, fence));
        } catch (...) {
            if (fence != VK_NULL_HANDLE) {
                vkDestroyFence(device_, fence, nullptr);
            }
            vkFreeCommandBuffers(device_, cmdPool_, 1, &cmdBuf);
            throw;
        }

        Submission submission;
        submission.fence = fence;
        submission.cmdBuf = cmdBuf;
        submission.onComplete = onComplete;
        submission.status = VK_NOT_READY;
        inFlight_.push_back(std::move(submission));
    }

    // Caller holds mutex_.
    void Framework::collectFinished(std::vector<Submission> &done) {
        std::vector<Submission> pending;
        for (Submission &s : inFlight_) {
            VkResult status = vkGetFenceStatus(device_, s.fence);
            if (status == VK_NOT_READY) {
                pending.push_back(std::move(s));
            } else {
                s.status = status;
                done.push_back(std::move(s));
                ++retiring_;
            }
        }
        inFlight_.swap(pending);
    }

    size_t Framework::retire(std::vector<Submission> &done) {
        // Completions run unlocked; they may submit or poll again. A throwing
        // completion does not stop the rest of the batch from retiring.
        std::exception_ptr failure;
        for (Submission &s : done) {
            if (!s.onComplete) continue;
            try {
                s.onComplete(s.status);
            } catch (...) {
                if (!failure) failure = std::current_exception();
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (Submission &s : done) {
                vkDestroyFence(device_, s.fence, nullptr);
                vkFreeCommandBuffers(device_, cmdPool_, 1, &s.cmdBuf);
            }
            retiring_ -= done.size();
        }
        retired_.notify_all();

        size_t count = done.size();
        done.clear();
        if (failure) {
            std::rethrow_exception(failure);
        }
        return count;
    }

    size_t Framework::poll() {
        std::vector<Submission> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            collectFinished(done);
        }
        return retire(done);
    }

    size_t Framework::blockingPoll() {
        std::vector<Submission> done;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // A submission another thread already collected is resolved only
            // once its completion ran
            retired_.wait(lock, [this] { return retiring_ == 0; });
            if (!inFlight_.empty()) {
                std::vector<VkFence> fences;
                fences.reserve(inFlight_.size());
                for (const Submission &s : inFlight_) {
                    fences.push_back(s.fence);
                }
                VkResult result = vkWaitForFences(device_, static_cast<uint32_t>(fences.size()), fences.data(),
                                                  VK_TRUE, UINT64_MAX);
                // Device loss is reported per submission by vkGetFenceStatus below
                if (result != VK_SUCCESS && result != VK_ERROR_DEVICE_LOST) {
                    throw VulkanError(result, "Waiting for submissions failed", __FILE__, __LINE__);
                }
            }
            collectFinished(done);
        }
        return retire(done);
    }

    size_t Framework::pendingSubmissions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inFlight_.size();
    }

    VkResult Framework::waitForSubmissions() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_.empty()) return VK_SUCCESS;

        std::vector<VkFence> fences;
        fences.reserve(inFlight_.size());
        for (const Submission &s : inFlight_) {
            fences.push_back(s.fence);
        }
        return vkWaitForFences(device_, static_cast<uint32_t>(fences.size()), fences.data(), VK_TRUE, UINT64_MAX);
    }

    void Framework::teardown() noexcept {
        if (tornDown_) return;

        if (device_ != VK_NULL_HANDLE) {
            VkResult idle = vkDeviceWaitIdle(device_);
            if (idle != VK_SUCCESS) {
                gpgpu_log(LogLevel::Warning, "gpgpu: vkDeviceWaitIdle failed during teardown: %s\n",
                          vkResultString(idle));
            }

            // Resolve whatever is still in flight; staging buffers die here
            std::vector<Submission> done;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                collectFinished(done);
                retiring_ += inFlight_.size();
                for (Submission &s : inFlight_) {
                    s.status = VK_ERROR_DEVICE_LOST;
                    done.push_back(std::move(s));
                }
                inFlight_.clear();
            }
            try {
                retire(done);
            } catch (const std::exception &e) {
                gpgpu_log(LogLevel::Error, "gpgpu: completion failed during teardown: %s\n", e.what());
            }
        }

        // From here on every FrameworkHandle reports expired
        self_.reset();

        if (device_ != VK_NULL_HANDLE) {
            if (cmdPool_ != VK_NULL_HANDLE) {
                vkDestroyCommandPool(device_, cmdPool_, nullptr);
                cmdPool_ = VK_NULL_HANDLE;
            }
            vkDestroyDevice(device_, nullptr);
            device_ = VK_NULL_HANDLE;
        }

        if (debugMessenger_ != VK_NULL_HANDLE) {
            vkDestroyDebugUtilsMessengerEXT(instance_, debugMessenger_, nullptr);
            debugMessenger_ = VK_NULL_HANDLE;
        }

        if (instance_ != VK_NULL_HANDLE) {
            vkDestroyInstance(instance_, nullptr);
            instance_ = VK_NULL_HANDLE;
        }

        tornDown_ = true;
    }

    // -------- Staged transfers ---------------------------------------------------
    namespace {
        typedef std::function<void(VkCommandBuffer, VkBuffer)> StagedCopyFn;

        Deferred<void> readyDeferred(const FrameworkHandle &fw) {
            std::promise<void> promise;
            promise.set_value();
            return Deferred<void>(fw, promise.get_future());
        }

        // Copies data into a fresh staging buffer right away and submits the
        // staging -> resource copy. The staging buffer lives until the copy retired.
        Deferred<void> stagedUpload(Framework &fw, const void *data, VkDeviceSize bytes, const StagedCopyFn &recordCopy) {
            std::shared_ptr<Buffer> staging =
                std::make_shared<Buffer>(fw, BufferInfo(bytes, BufferUsage::Staging, HostAccess::Write));
            {
                BufferMapping mapping = staging->mapWrite(0, bytes);
                std::memcpy(mapping.data(), data, static_cast<size_t>(bytes));
            }

            std::shared_ptr<std::promise<void> > promise = std::make_shared<std::promise<void> >();
            Deferred<void> result(fw.handle(), promise->get_future());

            VkBuffer src = staging->vk();
            fw.submit([&recordCopy, src](VkCommandBuffer cmd) { recordCopy(cmd, src); },
                      [promise, staging](VkResult status) {
                          if (status == VK_SUCCESS) {
                              promise->set_value();
                          } else {
                              promise->set_exception(std::make_exception_ptr(
                                  VulkanError(status, "Upload failed on the device", __FILE__, __LINE__)));
                          }
                      });
            return result;
        }

        // Submits resource -> staging and hands the mapped bytes to onData on retire.
        void stagedDownload(Framework &fw, VkDeviceSize bytes, const StagedCopyFn &recordCopy,
                            const Buffer::ReadbackFn &onData) {
            std::shared_ptr<Buffer> staging =
                std::make_shared<Buffer>(fw, BufferInfo(bytes, BufferUsage::Staging, HostAccess::Read));

            VkBuffer dst = staging->vk();
            fw.submit([&recordCopy, dst](VkCommandBuffer cmd) {
                          recordCopy(cmd, dst);
                          VkMemoryBarrier toHost{
                              VK_STRUCTURE_TYPE_MEMORY_BARRIER,
                              nullptr,
                              VK_ACCESS_TRANSFER_WRITE_BIT,
                              VK_ACCESS_HOST_READ_BIT
                          };
                          vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_HOST_BIT,
                                               0, 1, &toHost, 0, nullptr, 0, nullptr);
                      },
                      [staging, bytes, onData](VkResult status) {
                          if (status != VK_SUCCESS) {
                              onData(status, nullptr, 0);
                              return;
                          }
                          try {
                              BufferMapping mapping = staging->mapRead(0, bytes);
                              onData(VK_SUCCESS, mapping.data(), bytes);
                          } catch (const VulkanError &e) {
                              onData(e.getResult(), nullptr, 0);
                          }
                      });
        }
    } // namespace

    // -------- BufferMapping implementation --------------------------------------
    BufferMapping::BufferMapping() : buf_(nullptr), ptr_(nullptr), offset_(0), length_(0), write_(false) {}

    BufferMapping::~BufferMapping() noexcept {
        release();
    }

    BufferMapping::BufferMapping(BufferMapping &&other) noexcept
        : buf_(other.buf_),
          ptr_(other.ptr_),
          offset_(other.offset_),
          length_(other.length_),
          write_(other.write_) {
        other.buf_ = nullptr;
        other.ptr_ = nullptr;
    }

    BufferMapping &BufferMapping::operator=(BufferMapping &&other) noexcept {
        if (this != &other) {
            release();

            buf_ = other.buf_;
            ptr_ = other.ptr_;
            offset_ = other.offset_;
            length_ = other.length_;
            write_ = other.write_;

            other.buf_ = nullptr;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    void BufferMapping::release() noexcept {
        if (!buf_ || !ptr_) return;

        Framework *fw = buf_->fw_.tryGet();
        if (fw) {
            if (write_) {
                try {
                    buf_->flushRange(offset_, length_);
                } catch (const VulkanError &e) {
                    gpgpu_log(LogLevel::Error, "gpgpu: flushing mapped range failed: %s\n", e.what());
                }
            }
            vkUnmapMemory(fw->vk(), buf_->memory_);
        }
        buf_ = nullptr;
        ptr_ = nullptr;
    }

    // -------- Buffer implementation ----------------------------------------------
    static VkBufferUsageFlags bufferUsageToVk(BufferUsage usage) {
        VkBufferUsageFlags flags = VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;

        switch (usage) {
        case BufferUsage::Storage:
            flags |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
            break;
        case BufferUsage::Uniform:
            flags |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            break;
        case BufferUsage::Staging:
            // Just transfer flags
            break;
        }
        return flags;
    }

    Buffer::Buffer(Framework &fw, const BufferInfo &info)
        : fw_(fw.handle()),
          buffer_(VK_NULL_HANDLE),
          memory_(VK_NULL_HANDLE),
          size_(info.sizeBytes),
          allocSize_(std::max<VkDeviceSize>(alignUp(info.sizeBytes, 4), 4)),
          memFlags_(0),
          usage_(info.usage),
          hostAccess_(info.host),
          tornDown_(false),
          alive_(std::make_shared<bool>(true)) {
        if (usage_ == BufferUsage::Staging && hostAccess_ == HostAccess::None) {
            throw std::invalid_argument("Staging buffers need host access");
        }

        VkBufferUsageFlags usage = bufferUsageToVk(info.usage);

        if (hostAccess_ == HostAccess::None) {
            memFlags_ = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
            createVkBuffer(fw, usage, memFlags_);
            return;
        }

        memFlags_ = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
        try {
            createVkBuffer(fw, usage, memFlags_);
        } catch (const std::runtime_error &) {
            // Fall back to cached memory
            memFlags_ = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_CACHED_BIT;
            try {
                createVkBuffer(fw, usage, memFlags_);
            } catch (const std::runtime_error &) {
                // Fall back to host-visible (non-coherent)
                memFlags_ = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT;
                createVkBuffer(fw, usage, memFlags_);
            }
        }
    }

    Buffer::Buffer(Buffer &&other) noexcept
        : fw_(other.fw_),
          buffer_(other.buffer_),
          memory_(other.memory_),
          size_(other.size_),
          allocSize_(other.allocSize_),
          memFlags_(other.memFlags_),
          usage_(other.usage_),
          hostAccess_(other.hostAccess_),
          tornDown_(other.tornDown_),
          alive_(std::move(other.alive_)) {
        other.buffer_ = VK_NULL_HANDLE;
        other.memory_ = VK_NULL_HANDLE;
        other.tornDown_ = true;
    }

    Buffer &Buffer::operator=(Buffer &&other) noexcept {
        if (this != &other) {
            teardown();
            fw_ = other.fw_;
            buffer_ = other.buffer_;
            memory_ = other.memory_;
            size_ = other.size_;
            allocSize_ = other.allocSize_;
            memFlags_ = other.memFlags_;
            usage_ = other.usage_;
            hostAccess_ = other.hostAccess_;
            tornDown_ = other.tornDown_;
            alive_ = std::move(other.alive_);

            other.buffer_ = VK_NULL_HANDLE;
            other.memory_ = VK_NULL_HANDLE;
            other.tornDown_ = true;
        }
        return *this;
    }

    Buffer::~Buffer() noexcept {
        if (!tornDown_) {
            teardown();
        }
    }

    BufferMapping Buffer::mapWrite(VkDeviceSize offsetBytes, VkDeviceSize lengthBytes) {
        if (lengthBytes == VK_WHOLE_SIZE) {
            if (offsetBytes >= size_) {
                throw std::out_of_range("Write map offset beyond buffer size");
            }
            lengthBytes = size_ - offsetBytes;
        }

        validateRange(offsetBytes, lengthBytes, "mapWrite");

        if (hostAccess_ != HostAccess::Write && hostAccess_ != HostAccess::ReadWrite) {
            throw std::logic_error("Buffer does not support write mapping");
        }

        Framework &fw = fw_.get();

        // Map an aligned superset per nonCoherentAtomSize (safe for both coherent and non-coherent)
        VkDeviceSize atom = fw.limits().nonCoherentAtomSize;
        VkDeviceSize alignedOff = alignDown(offsetBytes, atom);
        VkDeviceSize alignedLen = alignUp(lengthBytes + (offsetBytes - alignedOff), atom);
        if (alignedOff + alignedLen > allocSize_) alignedLen = allocSize_ - alignedOff;

        void *base = nullptr;
        GPGPU_VK_CHECK(vkMapMemory(fw.vk(), memory_, alignedOff, alignedLen, 0, &base));
        void *userPtr = static_cast<char *>(base) + (offsetBytes - alignedOff);
        return BufferMapping(this, userPtr, alignedOff, alignedLen, true);
    }

    BufferMapping Buffer::mapRead(VkDeviceSize offsetBytes, VkDeviceSize lengthBytes) {
        if (lengthBytes == VK_WHOLE_SIZE) {
            if (offsetBytes >= size_) {
                throw std::out_of_range("Read map offset beyond buffer size");
            }
            lengthBytes = size_ - offsetBytes;
        }

        validateRange(offsetBytes, lengthBytes, "mapRead");

        if (hostAccess_ != HostAccess::Read && hostAccess_ != HostAccess::ReadWrite) {
            throw std::logic_error("Buffer does not support read mapping");
        }

        Framework &fw = fw_.get();

        VkDeviceSize atom = fw.limits().nonCoherentAtomSize;
        VkDeviceSize alignedOff = alignDown(offsetBytes, atom);
        VkDeviceSize alignedLen = alignUp(lengthBytes + (offsetBytes - alignedOff), atom);
        if (alignedOff + alignedLen > allocSize_) alignedLen = allocSize_ - alignedOff;

        void *base = nullptr;
        GPGPU_VK_CHECK(vkMapMemory(fw.vk(), memory_, alignedOff, alignedLen, 0, &base));
        BufferMapping mapping(this, static_cast<char *>(base) + (offsetBytes - alignedOff), alignedOff, alignedLen, false);
        invalidateRange(alignedOff, alignedLen);
        return mapping;
    }

    void Buffer::fill(uint32_t value) {
        Framework &fw = fw_.get();
        VkBuffer buffer = buffer_;
        fw.submit([buffer, value](VkCommandBuffer cmd) {
            vkCmdFillBuffer(cmd, buffer, 0, VK_WHOLE_SIZE, value);
        });
    }

    Deferred<void> Buffer::uploadAsync(const void *data, VkDeviceSize bytes) {
        Framework &fw = fw_.get();
        checkTransferSize("Buffer write", size_, bytes);
        if (bytes == 0) {
            return readyDeferred(fw_);
        }
        if (!data) {
            throw std::invalid_argument("Buffer write: source pointer is null");
        }

        VkBuffer dst = buffer_;
        return stagedUpload(fw, data, bytes, [dst, bytes](VkCommandBuffer cmd, VkBuffer staging) {
            VkBufferCopy region{0, 0, bytes};
            vkCmdCopyBuffer(cmd, staging, dst, 1, &region);
        });
    }

    void Buffer::downloadAsync(const ReadbackFn &onData) const {
        Framework &fw = fw_.get();
        if (size_ == 0) {
            // Nothing to copy; resolve on the next poll like any other read
            fw.submit([](VkCommandBuffer) {}, [onData](VkResult status) { onData(status, nullptr, 0); });
            return;
        }

        VkBuffer src = buffer_;
        VkDeviceSize bytes = size_;
        stagedDownload(fw, bytes, [src, bytes](VkCommandBuffer cmd, VkBuffer staging) {
            VkBufferCopy region{0, 0, bytes};
            vkCmdCopyBuffer(cmd, src, staging, 1, &region);
        }, onData);
    }

    void Buffer::validateRange(VkDeviceSize offset, VkDeviceSize len, const char *operation) const {
        if (len == 0) {
            throw std::invalid_argument(std::string("Buffer ") + operation + ": length cannot be zero");
        }

        if (offset >= size_) {
            throw std::out_of_range(std::string("Buffer ") + operation + ": offset beyond buffer size");
        }

        if (offset > size_ - len) { // Avoids overflow in offset + len
            throw std::out_of_range(std::string("Buffer ") + operation + ": range exceeds buffer bounds (offset=" +
                std::to_string(offset) + " len=" + std::to_string(len) + " size=" + std::to_string(size_) + ")");
        }
    }

    void Buffer::createVkBuffer(Framework &fw, VkBufferUsageFlags usage, VkMemoryPropertyFlags props) {
        VkBufferCreateInfo bufferInfo{
            VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
            nullptr,
            0,
            allocSize_,
            usage,
            VK_SHARING_MODE_EXCLUSIVE,
            0, nullptr
        };

        VkBuffer buf = VK_NULL_HANDLE;
        VkResult result = vkCreateBuffer(fw.vk(), &bufferInfo, nullptr, &buf);
        if (result != VK_SUCCESS) {
            throw VulkanError(result, "Buffer creation failed", __FILE__, __LINE__);
        }

        VkMemoryRequirements memReqs;
        vkGetBufferMemoryRequirements(fw.vk(), buf, &memReqs);

        uint32_t memoryTypeIndex = 0;
        try {
            memoryTypeIndex = fw.selectMemory(memReqs.memoryTypeBits, props);
        } catch (const std::runtime_error &) {
            vkDestroyBuffer(fw.vk(), buf, nullptr);
            throw;
        }

        VkMemoryAllocateInfo allocInfo{
            VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO,
            nullptr,
            memReqs.size,
            memoryTypeIndex
        };
        VkDeviceMemory mem = VK_NULL_HANDLE;
        result = vkAllocateMemory(fw.vk(), &allocInfo, nullptr, &mem);
        if (result != VK_SUCCESS) {
            vkDestroyBuffer(fw.vk(), buf, nullptr);
            throw VulkanError(result, "Memory allocation failed", __FILE__, __LINE__);
        }

        result = vkBindBufferMemory(fw.vk(), buf, mem, 0);
        if (result != VK_SUCCESS) {
            vkFreeMemory(fw.vk(), mem, nullptr);
            vkDestroyBuffer(fw.vk(), buf, nullptr);
            throw VulkanError(result, "Buffer memory binding failed", __FILE__, __LINE__);
        }

        buffer_ = buf;
        memory_ = mem;
    }

    void Buffer::flushRange(VkDeviceSize offset, VkDeviceSize sizeBytes) {
        if (memFlags_ & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) return;

        Framework &fw = fw_.get();
        VkDeviceSize atomSize = fw.limits().nonCoherentAtomSize;
        VkDeviceSize alignedOffset = alignDown(offset, atomSize);
        VkDeviceSize alignedSize = alignUp(sizeBytes + (offset - alignedOffset), atomSize);
        if (alignedOffset + alignedSize > allocSize_) {
            alignedSize = allocSize_ - alignedOffset;
        }

        VkMappedMemoryRange range{
            VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE,
            nullptr,
            memory_,
            alignedOffset,
            alignedSize
        };
        GPGPU_VK_CHECK(vkFlushMappedMemoryRanges(fw.vk(), 1, &range));
    }

    void Buffer::invalidateRange(VkDeviceSize offset, VkDeviceSize sizeBytes) {
        if (memFlags_ & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) return;

        Framework &fw = fw_.get();
        VkDeviceSize atomSize = fw.limits().nonCoherentAtomSize;
        VkDeviceSize alignedOffset = alignDown(offset, atomSize);
        VkDeviceSize alignedSize = alignUp(sizeBytes + (offset - alignedOffset), atomSize);
        if (alignedOffset + alignedSize > allocSize_) {
            alignedSize = allocSize_ - alignedOffset;
        }

        VkMappedMemoryRange range{
            VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE,
            nullptr,
            memory_,
            alignedOffset,
            alignedSize
        };
        GPGPU_VK_CHECK(vkInvalidateMappedMemoryRanges(fw.vk(), 1, &range));
    }

    void Buffer::teardown() noexcept {
        if (tornDown_) return;
        tornDown_ = true;
        alive_.reset();
        if (buffer_ == VK_NULL_HANDLE && memory_ == VK_NULL_HANDLE) return;

        Framework *fw = fw_.tryGet();
        if (!fw) {
            gpgpu_log(LogLevel::Warning, "gpgpu: buffer destroyed after its Framework, skipping release\n");
            buffer_ = VK_NULL_HANDLE;
            memory_ = VK_NULL_HANDLE;
            return;
        }

        // Staging buffers are only released once their own copy retired
        if (hostAccess_ == HostAccess::None) {
            VkResult result = fw->waitForSubmissions();
            if (result != VK_SUCCESS) {
                gpgpu_log(LogLevel::Warning, "gpgpu: waiting before buffer release failed: %s\n",
                          vkResultString(result));
            }
        }

        if (memory_ != VK_NULL_HANDLE) {
            vkFreeMemory(fw->vk(), memory_, nullptr);
            memory_ = VK_NULL_HANDLE;
        }
        if (buffer_ != VK_NULL_HANDLE) {
            vkDestroyBuffer(fw->vk(), buffer_, nullptr);
            buffer_ = VK_NULL_HANDLE;
        }
    }

    // -------- Image implementation -----------------------------------------------
    static const VkImageSubresourceRange kColorRange{VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    Image::Image(Framework &fw, const ImageInfo &info)
        : fw_(fw.handle()),
          image_(VK_NULL_HANDLE),
          memory_(VK_NULL_HANDLE),
          view_(VK_NULL_HANDLE),
          format_(info.format),
          width_(info.width),
          height_(info.height),
          pixelBytes_(info.pixelBytes),
          tornDown_(false),
          alive_(std::make_shared<bool>(true)) {
        if (info.width == 0 || info.height == 0) {
            throw std::invalid_argument("Image dimensions must be non-zero (got " + std::to_string(info.width) +
                                        "x" + std::to_string(info.height) + ")");
        }
        if (info.width > fw.limits().maxImageDimension2D || info.height > fw.limits().maxImageDimension2D) {
            throw std::invalid_argument("Image dimensions exceed maxImageDimension2D (" +
                                        std::to_string(fw.limits().maxImageDimension2D) + ")");
        }
        if (info.pixelBytes == 0) {
            throw std::invalid_argument("Image pixel size must be non-zero");
        }

        VkFormatProperties formatProps;
        vkGetPhysicalDeviceFormatProperties(fw.physical(), info.format, &formatProps);
        if (!(formatProps.optimalTilingFeatures & VK_FORMAT_FEATURE_STORAGE_IMAGE_BIT)) {
            throw std::runtime_error("Pixel format " + std::to_string(static_cast<int>(info.format)) +
                                     " cannot be used as a storage image on " + fw.deviceName());
        }

        try {
            VkImageCreateInfo imageInfo{
                VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
                nullptr,
                0,
                VK_IMAGE_TYPE_2D,
                info.format,
                VkExtent3D{info.width, info.height, 1},
                1,
                1,
                VK_SAMPLE_COUNT_1_BIT,
                VK_IMAGE_TILING_OPTIMAL,
                VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
                VK_SHARING_MODE_EXCLUSIVE,
                0, nullptr,
                VK_IMAGE_LAYOUT_UNDEFINED
            };
            GPGPU_VK_CHECK(vkCreateImage(fw.vk(), &imageInfo, nullptr, &image_));

            VkMemoryRequirements memReqs;
            vkGetImageMemoryRequirements(fw.vk(), image_, &memReqs);

            VkMemoryAllocateInfo allocInfo{
                VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO,
                nullptr,
                memReqs.size,
                fw.selectMemory(memReqs.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT)
            };
            GPGPU_VK_CHECK(vkAllocateMemory(fw.vk(), &allocInfo, nullptr, &memory_));
            GPGPU_VK_CHECK(vkBindImageMemory(fw.vk(), image_, memory_, 0));

            VkImageViewCreateInfo viewInfo{
                VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
                nullptr,
                0,
                image_,
                VK_IMAGE_VIEW_TYPE_2D,
                info.format,
                VkComponentMapping{VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
                                   VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY},
                kColorRange
            };
            GPGPU_VK_CHECK(vkCreateImageView(fw.vk(), &viewInfo, nullptr, &view_));

            // Images stay in GENERAL for their whole life: storage, copy src and copy dst
            VkImage image = image_;
            fw.submit([image](VkCommandBuffer cmd) {
                VkImageMemoryBarrier toGeneral{
                    VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER,
                    nullptr,
                    0,
                    VK_ACCESS_TRANSFER_WRITE_BIT | VK_ACCESS_SHADER_READ_BIT | VK_ACCESS_SHADER_WRITE_BIT,
                    VK_IMAGE_LAYOUT_UNDEFINED,
                    VK_IMAGE_LAYOUT_GENERAL,
                    VK_QUEUE_FAMILY_IGNORED,
                    VK_QUEUE_FAMILY_IGNORED,
                    image,
                    kColorRange
                };
                vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                                     0, 0, nullptr, 0, nullptr, 1, &toGeneral);
            });
        } catch (...) {
            teardown();
            throw;
        }
    }

    Image::Image(Image &&other) noexcept
        : fw_(other.fw_),
          image_(other.image_),
          memory_(other.memory_),
          view_(other.view_),
          format_(other.format_),
          width_(other.width_),
          height_(other.height_),
          pixelBytes_(other.pixelBytes_),
          tornDown_(other.tornDown_),
          alive_(std::move(other.alive_)) {
        other.image_ = VK_NULL_HANDLE;
        other.memory_ = VK_NULL_HANDLE;
        other.view_ = VK_NULL_HANDLE;
        other.tornDown_ = true;
    }

    Image &Image::operator=(Image &&other) noexcept {
        if (this != &other) {
            teardown();
            fw_ = other.fw_;
            image_ = other.image_;
            memory_ = other.memory_;
            view_ = other.view_;
            format_ = other.format_;
            width_ = other.width_;
            height_ = other.height_;
            pixelBytes_ = other.pixelBytes_;
            tornDown_ = other.tornDown_;
            alive_ = std::move(other.alive_);

            other.image_ = VK_NULL_HANDLE;
            other.memory_ = VK_NULL_HANDLE;
            other.view_ = VK_NULL_HANDLE;
            other.tornDown_ = true;
        }
        return *this;
    }

    Image::~Image() noexcept {
        if (!tornDown_) {
            teardown();
        }
    }

    VkExtent3D Image::extent() const {
        return VkExtent3D{width_, height_, 1};
    }

    VkDeviceSize Image::size() const {
        return static_cast<VkDeviceSize>(width_) * height_ * pixelBytes_;
    }

    void Image::clear() {
        Framework &fw = fw_.get();
        VkImage image = image_;
        fw.submit([image](VkCommandBuffer cmd) {
            VkClearColorValue zero;
            std::memset(&zero, 0, sizeof(zero));
            vkCmdClearColorImage(cmd, image, VK_IMAGE_LAYOUT_GENERAL, &zero, 1, &kColorRange);
        });
    }

    Deferred<void> Image::uploadAsync(const void *data, VkDeviceSize bytes) {
        Framework &fw = fw_.get();
        checkTransferSize("Image write", size(), bytes);
        if (!data) {
            throw std::invalid_argument("Image write: source pointer is null");
        }

        VkImage image = image_;
        VkExtent3D ext = extent();
        return stagedUpload(fw, data, bytes, [image, ext](VkCommandBuffer cmd, VkBuffer staging) {
            VkBufferImageCopy region{
                0, 0, 0, // tightly packed rows
                VkImageSubresourceLayers{VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1},
                VkOffset3D{0, 0, 0},
                ext
            };
            vkCmdCopyBufferToImage(cmd, staging, image, VK_IMAGE_LAYOUT_GENERAL, 1, &region);
        });
    }

    void Image::downloadAsync(const Buffer::ReadbackFn &onData) const {
        Framework &fw = fw_.get();
        VkImage image = image_;
        VkExtent3D ext = extent();
        stagedDownload(fw, size(), [image, ext](VkCommandBuffer cmd, VkBuffer staging) {
            VkBufferImageCopy region{
                0, 0, 0,
                VkImageSubresourceLayers{VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1},
                VkOffset3D{0, 0, 0},
                ext
            };
            vkCmdCopyImageToBuffer(cmd, image, VK_IMAGE_LAYOUT_GENERAL, staging, 1, &region);
        }, onData);
    }

    void Image::teardown() noexcept {
        if (tornDown_) return;
        tornDown_ = true;
        alive_.reset();
        if (image_ == VK_NULL_HANDLE && memory_ == VK_NULL_HANDLE && view_ == VK_NULL_HANDLE) return;

        Framework *fw = fw_.tryGet();
        if (!fw) {
            gpgpu_log(LogLevel::Warning, "gpgpu: image destroyed after its Framework, skipping release\n");
            image_ = VK_NULL_HANDLE;
            memory_ = VK_NULL_HANDLE;
            view_ = VK_NULL_HANDLE;
            return;
        }

        VkResult result = fw->waitForSubmissions();
        if (result != VK_SUCCESS) {
            gpgpu_log(LogLevel::Warning, "gpgpu: waiting before image release failed: %s\n", vkResultString(result));
        }

        if (view_ != VK_NULL_HANDLE) {
            vkDestroyImageView(fw->vk(), view_, nullptr);
            view_ = VK_NULL_HANDLE;
        }
        if (image_ != VK_NULL_HANDLE) {
            vkDestroyImage(fw->vk(), image_, nullptr);
            image_ = VK_NULL_HANDLE;
        }
        if (memory_ != VK_NULL_HANDLE) {
            vkFreeMemory(fw->vk(), memory_, nullptr);
            memory_ = VK_NULL_HANDLE;
        }
    }

    // -------- Shader reflection ----------------------------------------------------
    const uint32_t ShaderReflection::kExecutionModelGLCompute;

    namespace {
        // Opcodes, decorations and storage classes from the SPIR-V grammar
        const uint32_t kSpirvMagic = 0x07230203;
        const uint32_t kOpTypeImage = 25;
        const uint32_t kOpTypeArray = 28;
        const uint32_t kOpTypeRuntimeArray = 29;
        const uint32_t kOpTypeStruct = 30;
        const uint32_t kOpTypePointer = 32;
        const uint32_t kOpEntryPoint = 15;
        const uint32_t kOpVariable = 59;
        const uint32_t kOpDecorate = 71;
        const uint32_t kOpMemberDecorate = 72;

        const uint32_t kDecorationBlock = 2;
        const uint32_t kDecorationBufferBlock = 3;
        const uint32_t kDecorationNonWritable = 24;
        const uint32_t kDecorationNonReadable = 25;
        const uint32_t kDecorationBinding = 33;
        const uint32_t kDecorationDescriptorSet = 34;

        const uint32_t kStorageUniformConstant = 0;
        const uint32_t kStorageUniform = 2;
        const uint32_t kStorageStorageBuffer = 12;

        // Storage images are declared with Sampled == 2
        const uint32_t kImageSampledStorage = 2;

        // Literal string packed little-endian into words, NUL terminated.
        std::string readLiteralString(const uint32_t *words, size_t available, size_t &wordsUsed) {
            std::string out;
            for (size_t i = 0; i < available; ++i) {
                uint32_t word = words[i];
                for (int b = 0; b < 4; ++b) {
                    char c = static_cast<char>((word >> (8 * b)) & 0xFF);
                    if (c == '\0') {
                        wordsUsed = i + 1;
                        return out;
                    }
                    out.push_back(c);
                }
            }
            throw ShaderError("Malformed SPIR-V: unterminated literal string");
        }

        struct PointerType {
            uint32_t storageClass;
            uint32_t pointee;
        };

        struct Variable {
            uint32_t id;
            uint32_t type;
            uint32_t storageClass;
        };

        // Decorations that apply to a whole variable or to single block members.
        struct AccessDecorations {
            std::set<uint32_t> variables;
            std::map<uint32_t, std::set<uint32_t> > members; // struct id -> member indices

            void decorate(uint32_t id) { variables.insert(id); }
            void decorateMember(uint32_t structId, uint32_t member) { members[structId].insert(member); }

            bool applies(uint32_t variable, uint32_t pointee, const std::map<uint32_t, uint32_t> &memberCounts) const {
                if (variables.count(variable)) return true;
                std::map<uint32_t, uint32_t>::const_iterator count = memberCounts.find(pointee);
                std::map<uint32_t, std::set<uint32_t> >::const_iterator decorated = members.find(pointee);
                return count != memberCounts.end() && decorated != members.end() && count->second > 0 &&
                       decorated->second.size() == count->second;
            }
        };
    } // namespace

    ShaderReflection ShaderReflection::parse(const std::vector<uint32_t> &code) {
        if (code.size() < 5 || code[0] != kSpirvMagic) {
            throw ShaderError("Invalid SPIR-V module: missing header or magic number");
        }

        ShaderReflection refl;
        refl.version_ = code[1];

        std::map<uint32_t, uint32_t> sets;
        std::map<uint32_t, uint32_t> bindings;
        std::set<uint32_t> blocks;
        std::set<uint32_t> bufferBlocks;
        std::map<uint32_t, PointerType> pointers;
        std::map<uint32_t, uint32_t> arrays;
        std::map<uint32_t, uint32_t> images;
        std::map<uint32_t, uint32_t> structMembers;
        AccessDecorations nonWritable;
        AccessDecorations nonReadable;
        std::vector<Variable> variables;

        size_t pos = 5;
        while (pos < code.size()) {
            uint32_t wordCount = code[pos] >> 16;
            uint32_t opcode = code[pos] & 0xFFFF;
            if (wordCount == 0 || pos + wordCount > code.size()) {
                throw ShaderError("Malformed SPIR-V: instruction at word " + std::to_string(pos) +
                                  " overruns the module");
            }
            const uint32_t *ops = &code[pos];

            switch (opcode) {
            case kOpEntryPoint: {
                if (wordCount < 4) throw ShaderError("Malformed SPIR-V: truncated OpEntryPoint");
                ShaderEntryPoint entry;
                entry.executionModel = ops[1];
                size_t nameWords = 0;
                entry.name = readLiteralString(ops + 3, wordCount - 3, nameWords);
                for (size_t i = 3 + nameWords; i < wordCount; ++i) {
                    entry.interfaceIds.push_back(ops[i]);
                }
                refl.entryPoints_.push_back(entry);
                break;
            }
            case kOpDecorate:
                if (wordCount < 3) break;
                if (ops[2] == kDecorationBinding && wordCount >= 4) {
                    bindings[ops[1]] = ops[3];
                } else if (ops[2] == kDecorationDescriptorSet && wordCount >= 4) {
                    sets[ops[1]] = ops[3];
                } else if (ops[2] == kDecorationBlock) {
                    blocks.insert(ops[1]);
                } else if (ops[2] == kDecorationBufferBlock) {
                    bufferBlocks.insert(ops[1]);
                } else if (ops[2] == kDecorationNonWritable) {
                    nonWritable.decorate(ops[1]);
                } else if (ops[2] == kDecorationNonReadable) {
                    nonReadable.decorate(ops[1]);
                }
                break;
            case kOpMemberDecorate:
                if (wordCount < 4) break;
                if (ops[3] == kDecorationNonWritable) {
                    nonWritable.decorateMember(ops[1], ops[2]);
                } else if (ops[3] == kDecorationNonReadable) {
                    nonReadable.decorateMember(ops[1], ops[2]);
                }
                break;
            case kOpTypeStruct:
                if (wordCount >= 2) structMembers[ops[1]] = wordCount - 2;
                break;
            case kOpTypeImage:
                if (wordCount >= 9) images[ops[1]] = ops[7];
                break;
            case kOpTypeArray:
            case kOpTypeRuntimeArray:
                if (wordCount >= 3) arrays[ops[1]] = ops[2];
                break;
            case kOpTypePointer:
                if (wordCount >= 4) {
                    PointerType ptr = {ops[2], ops[3]};
                    pointers[ops[1]] = ptr;
                }
                break;
            case kOpVariable:
                if (wordCount >= 4) {
                    Variable var = {ops[2], ops[1], ops[3]};
                    variables.push_back(var);
                }
                break;
            default:
                break;
            }
            pos += wordCount;
        }

        for (const Variable &var : variables) {
            std::map<uint32_t, uint32_t>::const_iterator binding = bindings.find(var.id);
            if (binding == bindings.end()) continue;

            uint32_t pointee = 0;
            std::map<uint32_t, PointerType>::const_iterator ptr = pointers.find(var.type);
            if (ptr != pointers.end()) pointee = ptr->second.pointee;
            // Arrays of resources classify by their element type
            for (std::map<uint32_t, uint32_t>::const_iterator arr = arrays.find(pointee);
                 arr != arrays.end(); arr = arrays.find(pointee)) {
                pointee = arr->second;
            }

            BindingKind kind = BindingKind::Other;
            if (var.storageClass == kStorageStorageBuffer) {
                kind = BindingKind::StorageBuffer;
            } else if (var.storageClass == kStorageUniform) {
                if (bufferBlocks.count(pointee)) {
                    kind = BindingKind::StorageBuffer;
                } else if (blocks.count(pointee)) {
                    kind = BindingKind::UniformBuffer;
                }
            } else if (var.storageClass == kStorageUniformConstant) {
                std::map<uint32_t, uint32_t>::const_iterator img = images.find(pointee);
                if (img != images.end() && img->second == kImageSampledStorage) {
                    kind = BindingKind::StorageImage;
                }
            }

            std::map<uint32_t, uint32_t>::const_iterator set = sets.find(var.id);
            ShaderResource res;
            res.id = var.id;
            res.set = set == sets.end() ? 0u : set->second;
            res.binding = binding->second;
            res.kind = kind;
            res.readable = !nonReadable.applies(var.id, pointee, structMembers);
            res.writable = kind != BindingKind::UniformBuffer && !nonWritable.applies(var.id, pointee, structMembers);
            refl.resources_.push_back(res);
        }

        std::sort(refl.resources_.begin(), refl.resources_.end(),
                  [](const ShaderResource &a, const ShaderResource &b) {
                      return a.set != b.set ? a.set < b.set : a.binding < b.binding;
                  });
        return refl;
    }

    const ShaderEntryPoint *ShaderReflection::findEntryPoint(const std::string &name, uint32_t executionModel) const {
        for (const ShaderEntryPoint &entry : entryPoints_) {
            if (entry.name == name && entry.executionModel == executionModel) {
                return &entry;
            }
        }
        return nullptr;
    }

    std::vector<ShaderResource> ShaderReflection::resourcesUsedBy(const ShaderEntryPoint &entry) const {
        if (version_ < 0x00010400) {
            return resources_;
        }
        std::vector<ShaderResource> used;
        for (const ShaderResource &res : resources_) {
            if (std::find(entry.interfaceIds.begin(), entry.interfaceIds.end(), res.id) != entry.interfaceIds.end()) {
                used.push_back(res);
            }
        }
        return used;
    }

    // -------- ShaderModule implementation ----------------------------------------
    ShaderModule::ShaderModule(Framework &fw, const std::vector<uint32_t> &spirv)
        : fw_(fw.handle()),
          module_(VK_NULL_HANDLE),
          reflection_(ShaderReflection::parse(spirv)),
          alive_(std::make_shared<bool>(true)) {
        VkShaderModuleCreateInfo createInfo{
            VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
            nullptr,
            0,
            spirv.size() * sizeof(uint32_t),
            spirv.data()
        };
        GPGPU_VK_CHECK(vkCreateShaderModule(fw.vk(), &createInfo, nullptr, &module_));
    }

    ShaderModule ShaderModule::fromSpirv(Framework &fw, const std::vector<uint32_t> &spirv) {
        return ShaderModule(fw, spirv);
    }

    ShaderModule ShaderModule::fromSpirvFile(Framework &fw, const std::string &path) {
        return ShaderModule(fw, readSpirv(path));
    }

    ShaderModule::ShaderModule(ShaderModule &&other) noexcept
        : fw_(other.fw_),
          module_(other.module_),
          reflection_(std::move(other.reflection_)),
          alive_(std::move(other.alive_)) {
        other.module_ = VK_NULL_HANDLE;
    }

    ShaderModule &ShaderModule::operator=(ShaderModule &&other) noexcept {
        if (this != &other) {
            teardown();
            fw_ = other.fw_;
            module_ = other.module_;
            reflection_ = std::move(other.reflection_);
            alive_ = std::move(other.alive_);
            other.module_ = VK_NULL_HANDLE;
        }
        return *this;
    }

    ShaderModule::~ShaderModule() noexcept {
        teardown();
    }

    void ShaderModule::teardown() noexcept {
        alive_.reset();
        if (module_ == VK_NULL_HANDLE) return;
        // Pipelines keep their own copy of the code; no wait needed
        Framework *fw = fw_.tryGet();
        if (fw) {
            vkDestroyShaderModule(fw->vk(), module_, nullptr);
        }
        module_ = VK_NULL_HANDLE;
    }

    // -------- DescriptorSet implementation ---------------------------------------
    DescriptorSet &DescriptorSet::appendBuffer(const Buffer &buffer, VkDescriptorType type, BindingAccess access) {
        uint32_t binding = static_cast<uint32_t>(binds_.size());
        layout_.push_back(VkDescriptorSetLayoutBinding{binding, type, 1, VK_SHADER_STAGE_COMPUTE_BIT, nullptr});

        DescriptorBinding bind;
        bind.type = type;
        bind.access = access;
        // Exact logical range; a zero-length buffer binds its 4-byte backing
        bind.buffer = VkDescriptorBufferInfo{buffer.vk(), 0, buffer.size() > 0 ? buffer.size() : VK_WHOLE_SIZE};
        bind.image = VkDescriptorImageInfo{VK_NULL_HANDLE, VK_NULL_HANDLE, VK_IMAGE_LAYOUT_UNDEFINED};
        bind.byteSize = buffer.size();
        bind.framework = buffer.framework();
        bind.resource = buffer.liveness();
        binds_.push_back(bind);
        return *this;
    }

    DescriptorSet &DescriptorSet::appendImage(const Image &image, BindingAccess access) {
        uint32_t binding = static_cast<uint32_t>(binds_.size());
        layout_.push_back(VkDescriptorSetLayoutBinding{binding, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, 1,
                                                       VK_SHADER_STAGE_COMPUTE_BIT, nullptr});

        DescriptorBinding bind;
        bind.type = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
        bind.access = access;
        bind.buffer = VkDescriptorBufferInfo{VK_NULL_HANDLE, 0, 0};
        bind.image = VkDescriptorImageInfo{VK_NULL_HANDLE, image.view(), VK_IMAGE_LAYOUT_GENERAL};
        bind.byteSize = image.size();
        bind.framework = image.framework();
        bind.resource = image.liveness();
        binds_.push_back(bind);
        return *this;
    }

    // -------- Kernel implementation ------------------------------------------------
    Kernel::Kernel(Framework &fw, const std::string &entryPoint)
        : fw_(fw.handle()),
          layout_(VK_NULL_HANDLE),
          pipeline_(VK_NULL_HANDLE),
          pool_(VK_NULL_HANDLE),
          entryPoint_(entryPoint),
          tornDown_(false) {}

    Kernel::Kernel(Kernel &&other) noexcept
        : fw_(other.fw_),
          setLayouts_(std::move(other.setLayouts_)),
          layout_(other.layout_),
          pipeline_(other.pipeline_),
          pool_(other.pool_),
          sets_(std::move(other.sets_)),
          resources_(std::move(other.resources_)),
          entryPoint_(std::move(other.entryPoint_)),
          tornDown_(other.tornDown_) {
        other.setLayouts_.clear();
        other.sets_.clear();
        other.layout_ = VK_NULL_HANDLE;
        other.pipeline_ = VK_NULL_HANDLE;
        other.pool_ = VK_NULL_HANDLE;
        other.tornDown_ = true;
    }

    Kernel &Kernel::operator=(Kernel &&other) noexcept {
        if (this != &other) {
            teardown();
            fw_ = other.fw_;
            setLayouts_ = std::move(other.setLayouts_);
            layout_ = other.layout_;
            pipeline_ = other.pipeline_;
            pool_ = other.pool_;
            sets_ = std::move(other.sets_);
            resources_ = std::move(other.resources_);
            entryPoint_ = std::move(other.entryPoint_);
            tornDown_ = other.tornDown_;

            other.setLayouts_.clear();
            other.sets_.clear();
            other.layout_ = VK_NULL_HANDLE;
            other.pipeline_ = VK_NULL_HANDLE;
            other.pool_ = VK_NULL_HANDLE;
            other.tornDown_ = true;
        }
        return *this;
    }

    Kernel::~Kernel() noexcept {
        if (!tornDown_) {
            teardown();
        }
    }

    void Kernel::enqueue(uint32_t x, uint32_t y, uint32_t z) {
        if (tornDown_ || pipeline_ == VK_NULL_HANDLE) {
            throw std::logic_error("Kernel::enqueue on an empty kernel");
        }
        Framework &fw = fw_.get();
        for (const std::weak_ptr<bool> &resource : resources_) {
            if (resource.expired()) {
                throw std::logic_error("Kernel '" + entryPoint_ + "': a bound buffer or image was destroyed");
            }
        }

        const uint32_t counts[3] = {x, y, z};
        const char *axes[3] = {"x", "y", "z"};
        for (int i = 0; i < 3; ++i) {
            uint32_t maxCount = fw.limits().maxComputeWorkGroupCount[i];
            if (counts[i] == 0 || counts[i] > maxCount) {
                throw std::invalid_argument(std::string("Kernel::enqueue: workgroup count ") + axes[i] + "=" +
                                            std::to_string(counts[i]) + " outside [1, " +
                                            std::to_string(maxCount) + "]");
            }
        }

        fw.submit([this, x, y, z](VkCommandBuffer cmd) {
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline_);
            if (!sets_.empty()) {
                vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, layout_, 0,
                                        static_cast<uint32_t>(sets_.size()), sets_.data(), 0, nullptr);
            }
            vkCmdDispatch(cmd, x, y, z);
        });
    }

    void Kernel::teardown() noexcept {
        if (tornDown_) return;
        tornDown_ = true;

        Framework *fw = fw_.tryGet();
        if (!fw) {
            if (pipeline_ != VK_NULL_HANDLE) {
                gpgpu_log(LogLevel::Warning, "gpgpu: kernel '%s' destroyed after its Framework, skipping release\n",
                          entryPoint_.c_str());
            }
            return;
        }

        VkResult result = fw->waitForSubmissions();
        if (result != VK_SUCCESS) {
            gpgpu_log(LogLevel::Warning, "gpgpu: waiting before kernel release failed: %s\n", vkResultString(result));
        }

        VkDevice device = fw->vk();
        if (pipeline_ != VK_NULL_HANDLE) {
            vkDestroyPipeline(device, pipeline_, nullptr);
            pipeline_ = VK_NULL_HANDLE;
        }
        if (layout_ != VK_NULL_HANDLE) {
            vkDestroyPipelineLayout(device, layout_, nullptr);
            layout_ = VK_NULL_HANDLE;
        }
        if (pool_ != VK_NULL_HANDLE) {
            // Frees the sets as well
            vkDestroyDescriptorPool(device, pool_, nullptr);
            pool_ = VK_NULL_HANDLE;
        }
        sets_.clear();
        for (VkDescriptorSetLayout setLayout : setLayouts_) {
            if (setLayout != VK_NULL_HANDLE) {
                vkDestroyDescriptorSetLayout(device, setLayout, nullptr);
            }
        }
        setLayouts_.clear();
    }

    // -------- KernelBuilder implementation -------------------------------------------
    static BindingKind bindingKindOf(VkDescriptorType type) {
        switch (type) {
        case VK_DESCRIPTOR_TYPE_STORAGE_BUFFER: return BindingKind::StorageBuffer;
        case VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER: return BindingKind::UniformBuffer;
        case VK_DESCRIPTOR_TYPE_STORAGE_IMAGE: return BindingKind::StorageImage;
        default: return BindingKind::Other;
        }
    }

    KernelBuilder::KernelBuilder(Framework &fw, const ShaderModule &shader, const std::string &entryPoint)
        : fw_(fw.handle()),
          module_(shader.vk()),
          reflection_(shader.reflection()),
          shaderAlive_(shader.liveness()),
          entryPoint_(entryPoint),
          built_(false) {
        if (module_ == VK_NULL_HANDLE) {
            throw std::logic_error("KernelBuilder: shader module is empty");
        }
        if (shader.framework() != fw_) {
            throw std::invalid_argument("Shader module belongs to a different Framework");
        }
    }

    KernelBuilder &KernelBuilder::addDescriptorSet(const DescriptorSet &set) {
        if (built_) {
            throw std::logic_error("KernelBuilder::addDescriptorSet after build()");
        }
        sets_.push_back(set);
        return *this;
    }

    void KernelBuilder::validateBindings(Framework &fw) const {
        const VkPhysicalDeviceLimits &limits = fw.limits();
        FrameworkHandle self = fw.handle();
        for (size_t s = 0; s < sets_.size(); ++s) {
            const std::vector<DescriptorBinding> &binds = sets_[s].bindings();
            for (size_t b = 0; b < binds.size(); ++b) {
                const DescriptorBinding &bind = binds[b];
                std::string where = "group " + std::to_string(s) + " binding " + std::to_string(b);
                if (bind.framework.expired() || bind.framework != self) {
                    throw std::invalid_argument("Resource at " + where + " belongs to a different Framework");
                }
                if (bind.resource.expired()) {
                    throw std::logic_error("Resource at " + where + " was destroyed before build()");
                }
                if (bind.type == VK_DESCRIPTOR_TYPE_STORAGE_BUFFER && bind.byteSize > limits.maxStorageBufferRange) {
                    throw std::invalid_argument("Storage buffer at " + where + " exceeds maxStorageBufferRange (" +
                                                std::to_string(limits.maxStorageBufferRange) + ")");
                }
                if (bind.type == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER && bind.byteSize > limits.maxUniformBufferRange) {
                    throw std::invalid_argument("Uniform buffer at " + where + " exceeds maxUniformBufferRange (" +
                                                std::to_string(limits.maxUniformBufferRange) + ")");
                }
            }
        }
    }

    void KernelBuilder::validateAgainstShader() const {
        const ShaderReflection &refl = reflection_;
        const ShaderEntryPoint *entry = refl.findEntryPoint(entryPoint_);
        if (!entry) {
            std::string available;
            for (const ShaderEntryPoint &ep : refl.entryPoints()) {
                if (ep.executionModel != ShaderReflection::kExecutionModelGLCompute) continue;
                available += available.empty() ? ep.name : ", " + ep.name;
            }
            throw ShaderError("Compute entry point '" + entryPoint_ + "' not found in shader module" +
                              (available.empty() ? std::string(" (no compute entry points)")
                                                 : " (available: " + available + ")"), entryPoint_);
        }

        std::vector<ShaderResource> used = refl.resourcesUsedBy(*entry);
        for (const ShaderResource &res : used) {
            std::string where = "group " + std::to_string(res.set) + " binding " + std::to_string(res.binding);
            if (res.set >= sets_.size()) {
                throw ShaderError("Entry point '" + entryPoint_ + "' expects a " + bindingKindName(res.kind) +
                                  " at " + where + ", but only " + std::to_string(sets_.size()) +
                                  " descriptor set(s) were added", entryPoint_);
            }
            const DescriptorSet &set = sets_[res.set];
            if (res.binding >= set.size()) {
                throw ShaderError("Entry point '" + entryPoint_ + "' expects a " + bindingKindName(res.kind) +
                                  " at " + where + ", but group " + std::to_string(res.set) + " has only " +
                                  std::to_string(set.size()) + " binding(s)", entryPoint_);
            }
            BindingKind bound = bindingKindOf(set.layoutEntries()[res.binding].descriptorType);
            if (res.kind != BindingKind::Other && res.kind != bound) {
                throw ShaderError("Entry point '" + entryPoint_ + "' expects a " + bindingKindName(res.kind) +
                                  " at " + where + ", but a " + bindingKindName(bound) + " is bound", entryPoint_);
            }
            if (bound != BindingKind::StorageBuffer && bound != BindingKind::StorageImage) continue;

            BindingAccess access = set.bindings()[res.binding].access;
            if (res.writable && access == BindingAccess::ReadOnly) {
                throw ShaderError("Entry point '" + entryPoint_ + "' may write the " + bindingKindName(bound) +
                                  " at " + where + ", but it is bound read-only", entryPoint_);
            }
            if (res.readable && access == BindingAccess::WriteOnly) {
                throw ShaderError("Entry point '" + entryPoint_ + "' may read the " + bindingKindName(bound) +
                                  " at " + where + ", but it is bound write-only", entryPoint_);
            }
        }
    }

    Kernel KernelBuilder::build() {
        if (built_) {
            throw std::logic_error("KernelBuilder::build called twice");
        }
        built_ = true;

        Framework &fw = fw_.get();
        if (shaderAlive_.expired()) {
            throw std::logic_error("KernelBuilder::build: shader module for '" + entryPoint_ + "' was destroyed");
        }
        validateBindings(fw);
        validateAgainstShader();

        VkDevice device = fw.vk();
        // Any throw below releases what was created through ~Kernel
        Kernel kernel(fw, entryPoint_);

        // 1. One layout per set, in insertion order
        for (const DescriptorSet &set : sets_) {
            VkDescriptorSetLayoutCreateInfo dslCreateInfo{
                VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
                nullptr,
                0,
                static_cast<uint32_t>(set.layoutEntries().size()),
                set.layoutEntries().data()
            };
            VkDescriptorSetLayout setLayout = VK_NULL_HANDLE;
            GPGPU_VK_CHECK(vkCreateDescriptorSetLayout(device, &dslCreateInfo, nullptr, &setLayout));
            kernel.setLayouts_.push_back(setLayout);
        }

        // 2. Pipeline layout and compute pipeline
        VkPipelineLayoutCreateInfo layoutCreateInfo{
            VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
            nullptr,
            0,
            static_cast<uint32_t>(kernel.setLayouts_.size()),
            kernel.setLayouts_.data(),
            0,
            nullptr
        };
        GPGPU_VK_CHECK(vkCreatePipelineLayout(device, &layoutCreateInfo, nullptr, &kernel.layout_));

        VkPipelineShaderStageCreateInfo stageInfo{
            VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
            nullptr,
            0,
            VK_SHADER_STAGE_COMPUTE_BIT,
            module_,
            kernel.entryPoint_.c_str(),
            nullptr
        };

        VkComputePipelineCreateInfo pipelineInfo{
            VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO,
            nullptr,
            0,
            stageInfo,
            kernel.layout_,
            VK_NULL_HANDLE,
            0
        };
        GPGPU_VK_CHECK(vkCreateComputePipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &kernel.pipeline_));

        // 3. Descriptor pool and sets
        std::map<VkDescriptorType, uint32_t> typeCounts;
        for (const DescriptorSet &set : sets_) {
            for (const DescriptorBinding &bind : set.bindings()) {
                typeCounts[bind.type] += 1;
            }
        }

        if (!typeCounts.empty()) {
            std::vector<VkDescriptorPoolSize> poolSizes;
            poolSizes.reserve(typeCounts.size());
            for (const auto &pair : typeCounts) {
                poolSizes.push_back({pair.first, pair.second});
            }

            VkDescriptorPoolCreateInfo poolCreateInfo{
                VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
                nullptr,
                0,
                static_cast<uint32_t>(kernel.setLayouts_.size()),
                static_cast<uint32_t>(poolSizes.size()),
                poolSizes.data()
            };
            GPGPU_VK_CHECK(vkCreateDescriptorPool(device, &poolCreateInfo, nullptr, &kernel.pool_));

            kernel.sets_.resize(kernel.setLayouts_.size());
            VkDescriptorSetAllocateInfo allocInfo{
                VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
                nullptr,
                kernel.pool_,
                static_cast<uint32_t>(kernel.setLayouts_.size()),
                kernel.setLayouts_.data()
            };
            GPGPU_VK_CHECK(vkAllocateDescriptorSets(device, &allocInfo, kernel.sets_.data()));

            std::vector<VkWriteDescriptorSet> writes;
            for (size_t s = 0; s < sets_.size(); ++s) {
                const std::vector<DescriptorBinding> &binds = sets_[s].bindings();
                for (size_t b = 0; b < binds.size(); ++b) {
                    const DescriptorBinding &bind = binds[b];
                    bool isImage = bind.type == VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
                    writes.push_back(VkWriteDescriptorSet{
                        VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
                        nullptr,
                        kernel.sets_[s],
                        static_cast<uint32_t>(b),
                        0,
                        1,
                        bind.type,
                        isImage ? &bind.image : nullptr,
                        isImage ? nullptr : &bind.buffer,
                        nullptr
                    });
                }
            }
            vkUpdateDescriptorSets(device, static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);
        }

        for (const DescriptorSet &set : sets_) {
            for (const DescriptorBinding &bind : set.bindings()) {
                kernel.resources_.push_back(bind.resource);
            }
        }

        gpgpu_log(LogLevel::Debug, "gpgpu: built kernel '%s' with %u bind group(s)\n",
                  entryPoint_.c_str(), static_cast<unsigned>(sets_.size()));
        return kernel;
    }

    // -------- Utility functions -------------------------------------------------
    std::vector<uint32_t> readSpirv(const std::string &filename) {
        std::ifstream fin(filename.c_str(), std::ios::binary | std::ios::ate);
        if (!fin.is_open()) {
            throw std::runtime_error("failed opening file " + filename + " for reading");
        }

        const auto stream_size = static_cast<size_t>(fin.tellg());
        fin.seekg(0);

        if (stream_size % 4 != 0) {
            throw std::runtime_error("SPIR-V file " + filename + " has invalid size " +
                                     std::to_string(stream_size) + " (not multiple of 4 bytes)");
        }

        if (stream_size == 0) {
            throw std::runtime_error("SPIR-V file " + filename + " is empty");
        }

        std::vector<uint32_t> ret(stream_size / 4);
        fin.read(reinterpret_cast<char *>(ret.data()), static_cast<std::streamsize>(stream_size));

        if (fin.gcount() != static_cast<std::streamsize>(stream_size)) {
            throw std::runtime_error("Failed to read complete SPIR-V file: " + filename);
        }

        if (!isValidSPIRV(ret)) {
            throw std::runtime_error("Invalid SPIR-V content in file: " + filename);
        }

        return ret;
    }
} // namespace gpgpu
