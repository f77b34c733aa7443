#pragma once

#include "tool_registry.hpp"

namespace comic_mt {

// detector: contour, east; ocr: tesseract; inpainter: telea, ns; translator: llama.
void register_builtin_tools(ToolRegistry& registry);

}  // namespace comic_mt
