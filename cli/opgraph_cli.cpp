// FILE: cli/opgraph_cli.cpp
#include <getopt.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core/ocl.hpp>
#include <opencv2/imgcodecs.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "engine_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/ops.hpp"

namespace {

void print_cli_help() {
    std::cout << "Usage: opgraph_cli [options]\n"
              << "  -h, --help             Show this help and exit\n"
              << "  -c, --config <file>    Engine configuration (default: opgraph.yaml)\n"
              << "  -i, --image <file>     Image to inspect with the reference flow\n"
              << "  -t, --timeout <ms>     Run deadline in milliseconds (default: from config)\n"
              << "  -m, --max-blobs <n>    Largest blob count still judged OK (default: 0)\n"
              << "  -p, --print            Print the dependency tree of the reference flow\n"
              << "  -P, --plugins          Load plugins from the configured directories and list operators\n";
}

// image_source -> gaussian_blur -> threshold -> blob_analysis -> range_judge
std::shared_ptr<og::Flow> build_reference_flow(double max_blobs) {
    auto flow = std::make_shared<og::Flow>("inspection");
    flow->add_node(og::ops::make_node("image_source", "source", std::string("source")));
    flow->add_node(og::ops::make_node("gaussian_blur", "blur", std::string("blur"))
                       .set_param("ksize", 5.0));
    flow->add_node(og::ops::make_node("threshold", "binarize", std::string("binarize"))
                       .set_param("otsu", true));
    flow->add_node(og::ops::make_node("blob_analysis", "blobs", std::string("blobs"))
                       .set_param("min_area", 4.0));
    flow->add_node(og::ops::make_node("range_judge", "judge", std::string("judge"))
                       .set_param("min", 0.0)
                       .set_param("max", max_blobs));

    flow->connect("source", "image", "blur", "image");
    flow->connect("blur", "image", "binarize", "image");
    flow->connect("binarize", "image", "blobs", "image");
    flow->connect("blobs", "count", "judge", "value");
    return flow;
}

void print_node_table(const og::Flow& flow, const og::RunOutcome& outcome) {
    std::cout << std::left << std::setw(12) << "node" << std::setw(16) << "type"
              << std::setw(11) << "status" << std::right << std::setw(10) << "ms" << "  message\n";
    for (const auto& [id, rec] : outcome.nodes) {
        const og::Node& n = flow.node(id);
        std::cout << std::left << std::setw(12) << n.name() << std::setw(16) << n.type()
                  << std::setw(11) << og::to_string(rec.status) << std::right << std::setw(10)
                  << std::fixed << std::setprecision(2) << rec.duration_ms << "  " << rec.error_message
                  << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    // OpenCL 运行时在某些驱动上会输出无关错误，进程启动时直接关闭
    setenv("OPENCV_OPENCL_DEVICE", "disabled", 1);
    setenv("OPENCV_OPENCL_RUNTIME", "disabled", 1);
    cv::ocl::setUseOpenCL(false);

    std::string config_path = "opgraph.yaml";
    std::string image_path;
    std::optional<std::chrono::milliseconds> timeout;
    double max_blobs = 0.0;
    bool print_tree = false;
    bool list_plugins = false;

    const char* const short_opts = "hc:i:t:m:pP";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},          {"config", required_argument, nullptr, 'c'},
        {"image", required_argument, nullptr, 'i'},   {"timeout", required_argument, nullptr, 't'},
        {"max-blobs", required_argument, nullptr, 'm'}, {"print", no_argument, nullptr, 'p'},
        {"plugins", no_argument, nullptr, 'P'},       {nullptr, 0, nullptr, 0}};

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
            switch (opt) {
            case 'h': print_cli_help(); return 0;
            case 'c': config_path = optarg; break;
            case 'i': image_path = optarg; break;
            case 't': timeout = std::chrono::milliseconds(std::stol(optarg)); break;
            case 'm': max_blobs = std::stod(optarg); break;
            case 'p': print_tree = true; break;
            case 'P': list_plugins = true; break;
            default: print_cli_help(); return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid option value: " << e.what() << "\n";
        return 1;
    }

    og::EngineConfig config;
    og::load_or_create_config(config_path, config);

    try {
        og::Kernel kernel(config);

        if (list_plugins) {
            auto result = kernel.load_plugins();
            std::cout << "Plugins: " << result.loaded << "/" << result.attempted << " loaded\n";
            for (const auto& err : result.errors) {
                std::cerr << "  " << err.path << ": " << err.message << "\n";
            }
            for (const auto& [type, source] : kernel.plugins().op_sources()) {
                std::cout << "  " << std::left << std::setw(16) << type << source << "\n";
            }
        }

        auto flow = build_reference_flow(max_blobs);
        kernel.add_flow(flow);

        if (print_tree) {
            auto dump = kernel.dump_dependency_tree(flow->name(), std::nullopt, /*show_params*/ true);
            if (dump) std::cout << *dump;
        }

        if (image_path.empty()) {
            if (!print_tree && !list_plugins) print_cli_help();
            return 0;
        }

        cv::Mat img = cv::imread(image_path, cv::IMREAD_GRAYSCALE);
        if (img.empty()) {
            std::cerr << "Error: failed to read image '" << image_path << "'.\n";
            return 2;
        }
        // 为 blob_analysis 声明工作缓冲尺寸，开运算结果写入缓冲池借出的内存
        flow->mutable_node("blobs").set_working_size(og::ShapeKey{img.cols, img.rows, 1, og::DataType::UINT8});

        auto params = kernel.validate_parameters(flow->name());
        if (params) {
            for (const auto& w : params->warnings) std::cerr << "Warning: " << w << "\n";
            if (!params->ok()) {
                for (const auto& e : params->errors) std::cerr << "Error: " << e << "\n";
                return 2;
            }
        }

        auto result = kernel.inspect(flow->name(), og::fromCvMat(img), timeout);
        if (!result) {
            auto err = kernel.last_error(flow->name());
            std::cerr << "Error: " << (err ? err->message : std::string("inspection failed")) << "\n";
            return 2;
        }

        std::cout << "Verdict: " << og::to_string(result->status) << " (" << result->message << ")\n";
        std::cout << "Run " << result->run.run_id << " " << og::to_string(result->run.status) << " in "
                  << std::fixed << std::setprecision(2) << result->run.total_ms << " ms\n\n";
        print_node_table(*flow, result->run);

        auto events = kernel.drain_compute_events();
        if (!events.empty()) {
            std::cout << "\nEvents:\n";
            for (const auto& e : events) {
                std::cout << "  " << e.name << " -> " << og::to_string(e.status) << " (" << e.elapsed_ms
                          << " ms)\n";
            }
        }
        if (std::size_t dropped = kernel.events().dropped()) {
            std::cout << "  (" << dropped << " older events dropped)\n";
        }
        if (auto ep = kernel.runtime().first_exception()) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                std::cerr << "Warning: a worker task raised: " << e.what() << "\n";
            } catch (...) {
                std::cerr << "Warning: a worker task raised a non-standard exception.\n";
            }
        }
        auto stats = kernel.pool_stats();
        std::cout << "\nBuffer pool: " << stats.allocations << " allocations, " << stats.reuses << " reuses, "
                  << stats.footprint_bytes << " bytes held\n";

        return result->status == og::InspectionStatus::Error ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
