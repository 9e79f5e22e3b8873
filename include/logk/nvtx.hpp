// include/logk/nvtx.hpp
#pragma once
#include <cstdint>

// 시퀀스 커널 구간 표시. LOGK_ENABLE_NVTX 빌드에서만 nvToolsExt 로 push/pop.
#if defined(LOGK_ENABLE_NVTX)
  #include <nvToolsExt.h>
#endif

namespace logk { namespace nvtx {

// ARGB: in-place 커널은 Blue, 할당 커널은 Green
enum class Color : std::uint32_t {
  Blue  = 0xFF4C7DFF,
  Green = 0xFF66CC66,
};

class KernelRange {
public:
#if defined(LOGK_ENABLE_NVTX)
  KernelRange(const char* kernel, Color color) {
    nvtxEventAttributes_t attr{};
    attr.version       = NVTX_VERSION;
    attr.size          = NVTX_EVENT_ATTRIB_STRUCT_SIZE;
    attr.colorType     = NVTX_COLOR_ARGB;
    attr.color         = static_cast<std::uint32_t>(color);
    attr.messageType   = NVTX_MESSAGE_TYPE_ASCII;
    attr.message.ascii = kernel;
    nvtxRangePushEx(&attr);
  }
  ~KernelRange() { nvtxRangePop(); }
#else
  KernelRange(const char*, Color) {}
  ~KernelRange() {}
#endif

  KernelRange(const KernelRange&) = delete;
  KernelRange& operator=(const KernelRange&) = delete;
};

}} // namespace logk::nvtx

#define LOGK_NVTX_CONCAT_IMPL(x,y) x##y
#define LOGK_NVTX_CONCAT(x,y)      LOGK_NVTX_CONCAT_IMPL(x,y)

// 현재 scope 끝까지 kernel 구간
#define LOGK_NVTX_RANGE(kernel, color) \
  ::logk::nvtx::KernelRange LOGK_NVTX_CONCAT(_logk_range_, __LINE__) { (kernel), (color) }
