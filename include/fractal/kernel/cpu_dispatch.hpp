/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#pragma once
#include <string>

#include "fractal/kernel/texture_kernel.hpp"

namespace fractal
{

using CpuKernelFn = void (*)(const InvocationId &, const DispatchShape &, Image &);

// Kernel registered under the given entry name ("julia"). Throws
// std::invalid_argument for unknown names.
CpuKernelFn find_cpu_kernel(const std::string &kernel_name);

// Runs kernel once per invocation of the dispatch. Tiles are spread over
// OpenMP threads (num_threads <= 0 keeps the OpenMP default); the 8x8
// invocations of a tile run in order on the thread owning it.
void dispatch_cpu(CpuKernelFn          kernel,
                  const DispatchShape &shape,
                  Image               &image,
                  int                  num_threads = 0);

void dispatch_cpu(const std::string   &kernel_name,
                  const DispatchShape &shape,
                  Image               &image,
                  int                  num_threads = 0);

} // namespace fractal
