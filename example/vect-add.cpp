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

#include <cstdlib>
#include <iostream>
#include <vector>

#include <gpgpu.h>

static const uint32_t kSize = 1024u * 16u;
static const uint32_t kLocalSize = 64u; // must match local_size_x in vect-add.comp

int main(int argc, char **argv) {
    const char *spvPath = argc > 1 ? argv[1] : "vect-add.spv";

    try {
        // 1) Framework ------------------------------------------------------------
        gpgpu::FrameworkInfo info;
        info.enableValidationLayers = true;
        info.enableDebugUtils = true;
        gpgpu::Framework fw(info);

        std::cout << "Using device: " << fw.deviceName() << " [" << fw.vendorName() << "]\n";

        // 2) Buffers ----------------------------------------------------------------
        std::vector<uint32_t> a(kSize);
        std::vector<float> b(kSize);
        for (uint32_t i = 0; i < kSize; ++i) {
            a[i] = i;
            b[i] = static_cast<float>(i + 1);
        }

        gpgpu::GpuBuffer<uint32_t> aBuf = gpgpu::GpuBuffer<uint32_t>::fromSlice(fw, a);
        gpgpu::GpuBuffer<float> bBuf = gpgpu::GpuBuffer<float>::fromSlice(fw, b);
        gpgpu::GpuBuffer<float> cBuf(fw, kSize);

        // 3) Shader and kernel ----------------------------------------------------------
        gpgpu::ShaderModule shader = gpgpu::ShaderModule::fromSpirvFile(fw, spvPath);

        gpgpu::DescriptorSet set;
        set.bindBuffer(aBuf, gpgpu::AccessMode::ReadOnly)  // binding = 0 (uint)
            .bindBuffer(bBuf, gpgpu::AccessMode::ReadOnly) // binding = 1 (float)
            .bindBuffer(cBuf, gpgpu::AccessMode::ReadWrite); // binding = 2 (float)

        gpgpu::Kernel kernel = fw.createKernelBuilder(shader, "main").addDescriptorSet(set).build();

        // 4) Dispatch ---------------------------------------------------------------------
        std::cout << "Running kernel...\n";
        kernel.enqueue((kSize + kLocalSize - 1u) / kLocalSize);

        // 5) Read back and validate ---------------------------------------------------
        gpgpu::Deferred<std::vector<float> > pending = cBuf.readAsync();
        while (!pending.isReady()) {
            fw.poll();
        }
        std::vector<float> out = pending.get();

        for (uint32_t i = 0; i < kSize; ++i) {
            const float expect = static_cast<float>(i) + static_cast<float>(i + 1); // = 2*i + 1
            if (out[i] != expect) {
                std::cerr << "Mismatch at " << i << ": " << out[i] << " != " << expect << "\n";
                return EXIT_FAILURE;
            }
        }
        std::cout << "Validation passed!\n";
    } catch (const std::exception &e) {
        std::cerr << "vect-add failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
