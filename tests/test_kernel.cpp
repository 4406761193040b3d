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
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "test_support.h"

namespace {
    gpgpu::ShaderModule loadShader(gpgpu::Framework &fw, const char *name) {
        return gpgpu::ShaderModule::fromSpirvFile(fw, testShaderPath(name));
    }
} // namespace

TEST_CASE("vector add kernel", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuBuffer<uint32_t> a = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{1, 2, 3, 4});
    gpgpu::GpuBuffer<uint32_t> b = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{10, 20, 30, 40});
    gpgpu::GpuBuffer<uint32_t> c(*fw, 4);

    gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
    REQUIRE(shader.reflection().findEntryPoint("main") != nullptr);

    gpgpu::DescriptorSet set;
    set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(c, gpgpu::AccessMode::ReadWrite);
    REQUIRE(set.size() == 3);

    gpgpu::Kernel kernel = fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build();
    REQUIRE(kernel.entryPoint() == "main");
    REQUIRE(kernel.bindGroupCount() == 1);

    kernel.enqueue(4);
    REQUIRE(c.read() == std::vector<uint32_t>({11, 22, 33, 44}));

    // Re-enqueue after updating an input; bind groups stay attached
    b.write(std::vector<uint32_t>{100, 200, 300, 400});
    kernel.enqueue(4);
    REQUIRE(c.read() == std::vector<uint32_t>({101, 202, 303, 404}));
}

TEST_CASE("kernels validate their bind groups against the shader", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuBuffer<uint32_t> a(*fw, 4);
    gpgpu::GpuBuffer<uint32_t> b(*fw, 4);
    gpgpu::GpuBuffer<uint32_t> c(*fw, 4);
    gpgpu::GpuUniformBuffer<uint32_t> u(*fw, 4);
    gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");

    SECTION("unknown entry point") {
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(c, gpgpu::AccessMode::ReadWrite);
        gpgpu::KernelBuilder builder = fw->createKernelBuilder(shader, "does_not_exist");
        builder.addDescriptorSet(set);
        try {
            builder.build();
            FAIL("missing entry point was accepted");
        } catch (const gpgpu::ShaderError &e) {
            REQUIRE(e.getEntryPoint() == "does_not_exist");
            REQUIRE(std::string(e.what()).find("main") != std::string::npos);
        }
    }

    SECTION("uniform bound where storage is expected") {
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindUniformBuffer(u)
            .bindBuffer(c, gpgpu::AccessMode::ReadWrite);
        REQUIRE_THROWS_AS(fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build(), gpgpu::ShaderError);
    }

    SECTION("too few bindings") {
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly).bindBuffer(b, gpgpu::AccessMode::ReadOnly);
        REQUIRE_THROWS_AS(fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build(), gpgpu::ShaderError);
    }

    SECTION("no descriptor sets") {
        REQUIRE_THROWS_AS(fw->createKernelBuilder(shader, "main").build(), gpgpu::ShaderError);
    }
}

TEST_CASE("bind groups follow insertion order", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuUniformBuffer<uint32_t> factor = gpgpu::GpuUniformBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{3});
    gpgpu::GpuBuffer<uint32_t> data = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{1, 2, 3});
    gpgpu::ShaderModule shader = loadShader(*fw, "uniform_scale.spv");

    gpgpu::DescriptorSet params;
    params.bindUniformBuffer(factor);
    gpgpu::DescriptorSet values;
    values.bindBuffer(data, gpgpu::AccessMode::ReadWrite);

    SECTION("matching order") {
        gpgpu::Kernel kernel =
            fw->createKernelBuilder(shader, "main").addDescriptorSet(params).addDescriptorSet(values).build();
        REQUIRE(kernel.bindGroupCount() == 2);
        kernel.enqueue(3);
        REQUIRE(data.read() == std::vector<uint32_t>({3, 6, 9}));
    }

    SECTION("swapped order") {
        REQUIRE_THROWS_AS(
            fw->createKernelBuilder(shader, "main").addDescriptorSet(values).addDescriptorSet(params).build(),
            gpgpu::ShaderError);
    }
}

TEST_CASE("kernel builders are single use", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuBuffer<uint32_t> a(*fw, 2);
    gpgpu::GpuBuffer<uint32_t> b(*fw, 2);
    gpgpu::GpuBuffer<uint32_t> c(*fw, 2);
    gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
    gpgpu::DescriptorSet set;
    set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(c, gpgpu::AccessMode::ReadWrite);

    gpgpu::KernelBuilder builder = fw->createKernelBuilder(shader, "main");
    builder.addDescriptorSet(set);
    gpgpu::Kernel kernel = builder.build();
    REQUIRE(builder.isBuilt());
    REQUIRE_THROWS_AS(builder.build(), std::logic_error);
    REQUIRE_THROWS_AS(builder.addDescriptorSet(set), std::logic_error);

    REQUIRE_THROWS_AS(kernel.enqueue(0), std::invalid_argument);
    REQUIRE_THROWS_AS(kernel.enqueue(1, 0), std::invalid_argument);
    uint32_t tooMany = fw->limits().maxComputeWorkGroupCount[0] + 1;
    if (tooMany != 0) {
        REQUIRE_THROWS_AS(kernel.enqueue(tooMany), std::invalid_argument);
    }
}

TEST_CASE("storage image kernel", "[kernel][image][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 4, 2);
    gpgpu::ShaderModule shader = loadShader(*fw, "image_fill.spv");
    gpgpu::DescriptorSet set;
    set.bindImage(img);

    gpgpu::Kernel kernel = fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build();
    kernel.enqueue(4, 2);

    std::vector<uint8_t> bytes = img.read();
    REQUIRE(bytes.size() == 4 * 2 * 4);
    for (uint32_t y = 0; y < 2; ++y) {
        for (uint32_t x = 0; x < 4; ++x) {
            const uint8_t *p = &bytes[(y * 4 + x) * 4];
            CHECK(p[0] == x);
            CHECK(p[1] == y);
            CHECK(p[2] == 7);
            CHECK(p[3] == 255);
        }
    }
}

TEST_CASE("shader modules reject invalid SPIR-V", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    std::vector<uint32_t> garbage = {0xdeadbeefu, 0x00010000u, 0u, 1u, 0u};
    REQUIRE_THROWS_AS(gpgpu::ShaderModule::fromSpirv(*fw, garbage), gpgpu::ShaderError);
    REQUIRE_THROWS(gpgpu::ShaderModule::fromSpirvFile(*fw, "no/such/shader.spv"));
}

TEST_CASE("descriptor sets number mixed bindings in order", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);

    gpgpu::GpuBuffer<uint32_t> storage(*fw, 4);
    gpgpu::GpuUniformBuffer<uint32_t> uniform(*fw, 4);
    gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 2, 2);

    gpgpu::DescriptorSet set;
    set.bindBuffer(storage, gpgpu::AccessMode::ReadOnly).bindUniformBuffer(uniform).bindImage(img);

    const std::vector<VkDescriptorSetLayoutBinding> &layout = set.layoutEntries();
    REQUIRE(layout.size() == 3);
    for (uint32_t i = 0; i < layout.size(); ++i) {
        CHECK(layout[i].binding == i);
        CHECK(layout[i].descriptorCount == 1);
        CHECK(layout[i].stageFlags == VK_SHADER_STAGE_COMPUTE_BIT);
    }
    CHECK(layout[0].descriptorType == VK_DESCRIPTOR_TYPE_STORAGE_BUFFER);
    CHECK(layout[1].descriptorType == VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
    CHECK(layout[2].descriptorType == VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);

    const std::vector<gpgpu::DescriptorBinding> &binds = set.bindings();
    REQUIRE(binds.size() == 3);
    CHECK(binds[0].access == gpgpu::BindingAccess::ReadOnly);
    CHECK(binds[1].access == gpgpu::BindingAccess::ReadOnly);
    CHECK(binds[2].access == gpgpu::BindingAccess::WriteOnly);
    CHECK(binds[0].buffer.buffer == storage.raw().vk());
    CHECK(binds[1].buffer.buffer == uniform.raw().vk());
    CHECK(binds[2].image.imageLayout == VK_IMAGE_LAYOUT_GENERAL);
    for (const gpgpu::DescriptorBinding &b : binds) {
        CHECK_FALSE(b.resource.expired());
    }
}

TEST_CASE("buffer bindings cover the logical size", "[kernel][buffer][device]") {
    GPGPU_REQUIRE_DEVICE(fw);

    gpgpu::GpuBuffer<uint16_t> odd(*fw, 3);
    gpgpu::GpuBuffer<uint32_t> empty(*fw, 0);
    gpgpu::DescriptorSet set;
    set.bindBuffer(odd, gpgpu::AccessMode::ReadWrite).bindBuffer(empty, gpgpu::AccessMode::ReadOnly);

    REQUIRE(set.bindings()[0].buffer.offset == 0);
    REQUIRE(set.bindings()[0].buffer.range == 6);
    REQUIRE(set.bindings()[0].byteSize == 6);
    // A zero-length buffer binds its whole 4-byte backing
    REQUIRE(set.bindings()[1].buffer.range == VK_WHOLE_SIZE);
    REQUIRE(set.bindings()[1].byteSize == 0);
}

TEST_CASE("bind access must cover what the shader does", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuBuffer<uint32_t> a(*fw, 4);
    gpgpu::GpuBuffer<uint32_t> b(*fw, 4);
    gpgpu::GpuBuffer<uint32_t> c(*fw, 4);

    SECTION("written buffer bound read-only") {
        gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
        REQUIRE_FALSE(shader.reflection().resources().empty());
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(c, gpgpu::AccessMode::ReadOnly);
        try {
            fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build();
            FAIL("read-only binding of a written buffer was accepted");
        } catch (const gpgpu::ShaderError &e) {
            REQUIRE(std::string(e.what()).find("read-only") != std::string::npos);
        }
    }

    SECTION("read-only inputs may also be bound read-write") {
        gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadWrite)
            .bindBuffer(b, gpgpu::AccessMode::ReadWrite)
            .bindBuffer(c, gpgpu::AccessMode::ReadWrite);
        REQUIRE_NOTHROW(fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build());
    }

    SECTION("image that is read bound write-only") {
        gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> img(*fw, 2, 2);
        gpgpu::ShaderModule shader = loadShader(*fw, "image_accumulate.spv");
        gpgpu::DescriptorSet set;
        set.bindImage(img);
        try {
            fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build();
            FAIL("write-only binding of a read image was accepted");
        } catch (const gpgpu::ShaderError &e) {
            REQUIRE(std::string(e.what()).find("write-only") != std::string::npos);
        }
    }
}

TEST_CASE("kernel builders check their shader and Framework when building", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    SECTION("shader module destroyed") {
        gpgpu::GpuBuffer<uint32_t> a(*fw, 2);
        gpgpu::GpuBuffer<uint32_t> b(*fw, 2);
        gpgpu::GpuBuffer<uint32_t> c(*fw, 2);
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(c, gpgpu::AccessMode::ReadWrite);

        std::unique_ptr<gpgpu::ShaderModule> shader(new gpgpu::ShaderModule(loadShader(*fw, "vector_add.spv")));
        gpgpu::KernelBuilder builder = fw->createKernelBuilder(*shader, "main");
        builder.addDescriptorSet(set);
        shader.reset();
        REQUIRE_THROWS_AS(builder.build(), std::logic_error);
    }

    SECTION("moved shader module stays usable") {
        gpgpu::GpuBuffer<uint32_t> a = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{1, 2});
        gpgpu::GpuBuffer<uint32_t> b = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{5, 5});
        gpgpu::GpuBuffer<uint32_t> c(*fw, 2);
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(c, gpgpu::AccessMode::ReadWrite);

        gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
        gpgpu::KernelBuilder builder = fw->createKernelBuilder(shader, "main");
        builder.addDescriptorSet(set);
        gpgpu::ShaderModule moved(std::move(shader));
        REQUIRE(moved.vk() != VK_NULL_HANDLE);
        gpgpu::Kernel kernel = builder.build();
        kernel.enqueue(2);
        REQUIRE(c.read() == std::vector<uint32_t>({6, 7}));
    }

    SECTION("bound buffer destroyed before build") {
        gpgpu::GpuBuffer<uint32_t> a(*fw, 2);
        gpgpu::GpuBuffer<uint32_t> b(*fw, 2);
        std::unique_ptr<gpgpu::GpuBuffer<uint32_t> > c(new gpgpu::GpuBuffer<uint32_t>(*fw, 2));
        gpgpu::DescriptorSet set;
        set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
            .bindBuffer(*c, gpgpu::AccessMode::ReadWrite);

        gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");
        gpgpu::KernelBuilder builder = fw->createKernelBuilder(shader, "main");
        builder.addDescriptorSet(set);
        c.reset();
        REQUIRE_THROWS_AS(builder.build(), std::logic_error);
    }

    SECTION("Framework destroyed") {
        std::unique_ptr<gpgpu::Framework> local(new gpgpu::Framework());
        gpgpu::ShaderModule shader = loadShader(*local, "vector_add.spv");
        gpgpu::KernelBuilder builder = local->createKernelBuilder(shader, "main");
        local.reset();
        REQUIRE_THROWS_AS(builder.build(), std::logic_error);
    }
}

TEST_CASE("kernels refuse to run once a bound resource is gone", "[kernel][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    GPGPU_REQUIRE_SHADERS();

    gpgpu::GpuBuffer<uint32_t> a = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{1, 1, 1, 1});
    gpgpu::GpuBuffer<uint32_t> b = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{2, 2, 2, 2});
    std::unique_ptr<gpgpu::GpuBuffer<uint32_t> > c(new gpgpu::GpuBuffer<uint32_t>(*fw, 4));
    gpgpu::ShaderModule shader = loadShader(*fw, "vector_add.spv");

    gpgpu::DescriptorSet set;
    set.bindBuffer(a, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(b, gpgpu::AccessMode::ReadOnly)
        .bindBuffer(*c, gpgpu::AccessMode::ReadWrite);
    gpgpu::Kernel kernel = fw->createKernelBuilder(shader, "main").addDescriptorSet(set).build();

    // Moving the buffer keeps the binding alive
    gpgpu::GpuBuffer<uint32_t> moved(std::move(*c));
    kernel.enqueue(4);
    REQUIRE(moved.read() == std::vector<uint32_t>({3, 3, 3, 3}));

    c.reset();
    REQUIRE_NOTHROW(kernel.enqueue(4));
    fw->blockingPoll();

    {
        gpgpu::GpuBuffer<uint32_t> gone(std::move(moved));
    }
    REQUIRE_THROWS_AS(kernel.enqueue(4), std::logic_error);

    SECTION("images too") {
        std::unique_ptr<gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint> > img(
            new gpgpu::GpuImage<gpgpu::pixels::Rgba8Uint>(*fw, 2, 2));
        gpgpu::ShaderModule fill = loadShader(*fw, "image_fill.spv");
        gpgpu::DescriptorSet images;
        images.bindImage(*img);
        gpgpu::Kernel imageKernel = fw->createKernelBuilder(fill, "main").addDescriptorSet(images).build();
        img.reset();
        REQUIRE_THROWS_AS(imageKernel.enqueue(2, 2), std::logic_error);
    }
}
