/* Copyright (c) 2025 Otto Link. Distributed under the terms of the GNU General
 * Public License. The full license is in the file LICENSE, distributed with
 * this software. */
#include <map>
#include <stdexcept>

#ifdef FRACTAL_HAS_OPENMP
#include <omp.h>
#endif

#include "fractal/kernel/cpu_dispatch.hpp"
#include "fractal/kernel/image.hpp"
#include "fractal/logger.hpp"

namespace fractal
{

CpuKernelFn find_cpu_kernel(const std::string &kernel_name)
{
  static const std::map<std::string, CpuKernelFn> kernels = {{"julia", &julia}};

  auto it = kernels.find(kernel_name);
  if (it == kernels.end())
    throw std::invalid_argument("Unknown CPU kernel: " + kernel_name);

  return it->second;
}

void dispatch_cpu(CpuKernelFn          kernel,
                  const DispatchShape &shape,
                  Image               &image,
                  int                  num_threads)
{
  if (!kernel)
    throw std::invalid_argument("dispatch_cpu: kernel is nullptr");

  validate(shape);

  const int64_t tiles_x = static_cast<int64_t>(shape.tiles_x);
  const int64_t tiles_y = static_cast<int64_t>(shape.tiles_y);

#ifdef FRACTAL_HAS_OPENMP
  if (num_threads <= 0)
    num_threads = omp_get_max_threads();

  Logger::log()->trace("dispatch_cpu: {}x{} tiles on {} OpenMP threads",
                       tiles_x,
                       tiles_y,
                       num_threads);
#else
  Logger::log()->trace("dispatch_cpu: {}x{} tiles (no OpenMP, {} threads requested)",
                       tiles_x,
                       tiles_y,
                       num_threads);
#endif

  // writes of distinct invocations never alias, no synchronization needed
#pragma omp parallel for collapse(2) schedule(static) num_threads(num_threads)
  for (int64_t ty = 0; ty < tiles_y; ++ty)
    for (int64_t tx = 0; tx < tiles_x; ++tx)
      for (uint32_t ly = 0; ly < kTileSize; ++ly)
        for (uint32_t lx = 0; lx < kTileSize; ++lx)
          kernel(invocation_id(static_cast<uint32_t>(tx),
                               static_cast<uint32_t>(ty),
                               lx,
                               ly),
                 shape,
                 image);
}

void dispatch_cpu(const std::string   &kernel_name,
                  const DispatchShape &shape,
                  Image               &image,
                  int                  num_threads)
{
  dispatch_cpu(find_cpu_kernel(kernel_name), shape, image, num_threads);
}

} // namespace fractal
