#pragma once

#include "renderer.hpp"
#include "stages.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace comic_mt {

struct TranslatorSettings {
    std::string model_path;
    int n_ctx = 4096;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 1024;
};

struct PipelineSettings {
    std::size_t batch_size = 10;

    std::string detector = "contour";
    std::string detector_model;

    std::string ocr = "tesseract";
    std::string tessdata_path;
    int ocr_expansion_percent = 5;

    std::string inpainter = "telea";
    bool use_gpu = false;
    InpaintConfig inpaint;

    std::string translator = "llama";
    TranslatorSettings translator_settings;
    std::string extra_context;

    bool export_raw_text = false;
    bool export_translated_text = false;
    bool export_cleaned_image = false;

    // Source archive extension (".cbz") -> output container ("cbz"); save_as_override wins when set.
    std::map<std::string, std::string> save_as = {
        {".zip", "zip"},
        {".cbz", "cbz"},
    };
    std::string save_as_override;

    RenderSettings render;

    // Empty: outputs go next to each image (or its archive).
    std::filesystem::path output_dir;
    // Empty: derived from the wall clock when the run starts.
    std::string run_timestamp;
};

std::string inpainter_device(const PipelineSettings& settings);
std::string save_as_extension(const PipelineSettings& settings, const std::filesystem::path& archive_path);

}  // namespace comic_mt
