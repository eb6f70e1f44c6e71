#include "tc/core/pipeline/Coordinator.hpp"
#include "tc/core/pipeline/PipelineDriver.hpp"
#include "tc/core/storage/MemoryStorage.hpp"
#include "tc/core/util/Logging.hpp"
#include "tc/core/util/RunConfig.hpp"

#include <mpi.h>
#include <xtensor/core/xmath.hpp>
#include <xtensor/generators/xbuilder.hpp>
#include <xtensor/views/xview.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <numbers>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace
{

// Darks and flats recorded before and after the projections
constexpr std::size_t kDarks = 2;
constexpr std::size_t kFlats = 2;
constexpr float kDark = 10.0f;
constexpr float kFlat = 1010.0f;

tc::Pattern projection() { return {"PROJECTION", {1, 2}, {0}}; }
tc::Pattern sinogram() { return {"SINOGRAM", {0, 2}, {1}}; }

tc::SliceTuple frame(std::size_t f)
{
    return {tc::SliceIndex::single(f), tc::SliceIndex::full(), tc::SliceIndex::full()};
}

// Raw scan of a cylinder: darks, projections, flats along axis 0
class SyntheticScanLoader : public tc::LoaderStage
{
public:
    SyntheticScanLoader(std::size_t angles, std::size_t rows, std::size_t cols)
        : angles_(angles), rows_(rows), cols_(cols)
    {
    }

    std::string name() const override { return "SyntheticScanLoader"; }

    void load(tc::PipelineContext& ctx) override
    {
        const std::size_t frames = kDarks + angles_ + kFlats;
        tc::Dataset& tomo = ctx.registry().createInput("tomo");
        tomo.setShape({frames, rows_, cols_});
        tomo.setDtype(tc::Dtype::UInt16);
        tomo.addPattern(projection());
        tomo.addPattern(sinogram());

        std::set<std::size_t> excluded;
        for (std::size_t f = 0; f < kDarks; ++f) excluded.insert(f);
        for (std::size_t f = kDarks + angles_; f < frames; ++f) excluded.insert(f);
        tomo.markRaw(0, excluded);
        ctx.allocate(tomo);

        for (std::size_t f = 0; f < frames; ++f) {
            tc::Array img = xt::zeros<float>({std::size_t{1}, rows_, cols_});
            if (f < kDarks) {
                img.fill(kDark);
            } else if (f >= kDarks + angles_) {
                img.fill(kFlat);
            } else {
                const double theta = std::numbers::pi * double(f - kDarks) / double(angles_);
                for (std::size_t c = 0; c < cols_; ++c) {
                    const double x = (double(c) + 0.5) / double(cols_) * 2.0 - 1.0;
                    const double offset = 0.3 * std::cos(theta);
                    const double chord = std::max(0.0, 0.5 - (x - offset) * (x - offset));
                    const float transmitted = float(std::exp(-2.0 * std::sqrt(chord)));
                    for (std::size_t r = 0; r < rows_; ++r) {
                        img(0, r, c) = kDark + (kFlat - kDark) * transmitted;
                    }
                }
            }
            tc::writeRegion(ctx.storage(), tomo, frame(f), img);
        }
    }

private:
    std::size_t angles_;
    std::size_t rows_;
    std::size_t cols_;
};

// Flat/dark field correction of every projection
class NormaliseStage : public tc::Stage
{
public:
    explicit NormaliseStage(std::size_t maxFrames) : maxFrames_(maxFrames) {}

    std::string name() const override { return "NormaliseStage"; }

    void setup(tc::PipelineContext& ctx) override
    {
        const tc::Dataset& tomo = ctx.registry().input("tomo");
        std::vector<std::size_t> shape = tomo.shape();
        shape[0] -= tomo.excludedFrames().size();

        tc::Dataset& out = ctx.registry().createOutput("normalised");
        out.setShape(shape);
        out.setDtype(tc::Dtype::Float32);
        out.addPattern(projection());
        out.addPattern(sinogram());
    }

    tc::StagePatterns declarePatterns() const override
    {
        return {{{"tomo", "PROJECTION"}}, {{"normalised", "PROJECTION"}}};
    }

    std::size_t maxBatchSize() const override { return maxFrames_; }

    void preProcess(tc::PipelineContext& ctx) override
    {
        const tc::Dataset& tomo = ctx.registry().input("tomo");
        const std::size_t frames = tomo.shape()[0];
        tc::Array darks = ctx.read("tomo", frame(0));
        for (std::size_t f = 1; f < kDarks; ++f) {
            darks += ctx.read("tomo", frame(f));
        }
        tc::Array flats = ctx.read("tomo", frame(frames - kFlats));
        for (std::size_t f = frames - kFlats + 1; f < frames; ++f) {
            flats += ctx.read("tomo", frame(f));
        }
        dark_ = darks / float(kDarks);
        tc::Array range = flats / float(kFlats) - dark_;
        range_ = xt::maximum(range, 1e-6f);
    }

    void execute(tc::PipelineContext& ctx, const tc::StageBatch& batch) override
    {
        tc::Array data = ctx.read("tomo", batch.input("tomo").region);
        tc::Array out = (data - dark_) / range_;
        ctx.write("normalised", batch.output("normalised").region, out);
    }

private:
    std::size_t maxFrames_;
    tc::Array dark_;
    tc::Array range_;
};

// Repeated three point smoothing along detector columns
class SmoothStage : public tc::IterativeStage
{
public:
    explicit SmoothStage(std::size_t maxFrames) : maxFrames_(maxFrames) {}

    std::string name() const override { return "SmoothStage"; }

    void setup(tc::PipelineContext& ctx) override
    {
        const tc::Dataset& in = ctx.registry().input("normalised");
        for (const char* n : {"smoothed", "smoothed_alt"}) {
            tc::Dataset& out = ctx.registry().createOutput(n);
            out.setShape(in.shape());
            out.addPattern(projection());
        }
        setAlternatingDatasets(ctx, "smoothed", "smoothed_alt");
    }

    tc::StagePatterns declarePatterns() const override
    {
        return {
            {{"normalised", "PROJECTION"}},
            {{"smoothed", "PROJECTION"}, {"smoothed_alt", "PROJECTION"}}};
    }

    std::size_t maxBatchSize() const override { return maxFrames_; }

    void execute(tc::PipelineContext& ctx, const tc::StageBatch& batch) override
    {
        const tc::SliceTuple& region = batch.output("smoothed").region;
        tc::Array data = iteration() == 0 ? ctx.read("normalised", batch.input("normalised").region)
                                          : ctx.read(ctx.alternatingReader("smoothed"), region);
        tc::Array out = data;
        const auto cols = static_cast<std::ptrdiff_t>(data.shape()[2]);
        if (cols >= 3) {
            auto left = xt::view(data, xt::all(), xt::all(), xt::range(std::ptrdiff_t{0}, cols - 2));
            auto mid = xt::view(data, xt::all(), xt::all(), xt::range(std::ptrdiff_t{1}, cols - 1));
            auto right = xt::view(data, xt::all(), xt::all(), xt::range(std::ptrdiff_t{2}, cols));
            xt::view(out, xt::all(), xt::all(), xt::range(std::ptrdiff_t{1}, cols - 1)) =
                (left + mid + right) / 3.0f;
        }
        ctx.write(ctx.alternatingWriter("smoothed"), region, out);
    }

private:
    std::size_t maxFrames_;
};

// MPI_Init/MPI_Finalize for the lifetime of main
struct MpiSession {
    MpiSession(int* argc, char*** argv) { MPI_Init(argc, argv); }
    ~MpiSession() { MPI_Finalize(); }
    MpiSession(const MpiSession&) = delete;
    MpiSession& operator=(const MpiSession&) = delete;
};

std::string join(const std::vector<std::string>& names)
{
    std::ostringstream out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        out << (i ? ", " : "") << names[i];
    }
    return out.str();
}

std::vector<std::size_t> parseShape(const std::string& text)
{
    std::vector<std::size_t> shape;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        shape.push_back(std::stoul(item));
    }
    if (shape.size() != 3) {
        throw std::invalid_argument("--shape needs angles,rows,cols");
    }
    return shape;
}

int runPipeline(const tc::RunConfig& cfg, tc::Coordinator& coord, const po::variables_map& vm)
{
    const std::vector<std::size_t> shape = parseShape(vm["shape"].as<std::string>());
    const std::size_t maxFrames =
        vm.count("max-frames") ? vm["max-frames"].as<std::size_t>() : cfg.defaultMaxFrames;

    tc::MemoryStorage storage;
    tc::PipelineDriver driver(storage, coord, {cfg.metadataFile});
    driver.addLoader(std::make_unique<SyntheticScanLoader>(shape[0], shape[1], shape[2]));
    driver.addStage(std::make_unique<NormaliseStage>(maxFrames));
    auto smooth = std::make_unique<SmoothStage>(maxFrames);
    smooth->setIterations(vm["iterations"].as<std::size_t>());
    driver.addStage(std::move(smooth));

    driver.run();

    if (!coord.isCoordinator()) {
        return EXIT_SUCCESS;
    }
    for (const auto& r : driver.reports()) {
        std::cout << r.stage << ": " << r.localBatches << "/" << r.totalBatches << " batches, "
                  << r.iterations << " iteration(s); kept [" << join(r.kept) << "] removed ["
                  << join(r.removed) << "]" << std::endl;
    }
    const auto& results = driver.results();
    if (auto it = results.find("smoothed"); it != results.end()) {
        const tc::Dataset& ds = it->second;
        tc::SliceTuple all(ds.rank(), tc::SliceIndex::full());
        tc::Array data = tc::readRegion(storage, ds, all);
        std::cout << "smoothed: mean " << xt::mean(data)() << " over " << data.size()
                  << " values" << std::endl;
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("config,c", po::value<std::string>(), "JSON run configuration")
        ("shape,s", po::value<std::string>()->default_value("16,4,32"), "synthetic scan as angles,rows,cols")
        ("iterations,i", po::value<std::size_t>()->default_value(3), "smoothing iterations")
        ("max-frames,m", po::value<std::size_t>(), "frames per batch (overrides the configuration)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << "usage: " << argv[0] << " [-c config.json] [options]\n" << desc << std::endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
        std::cerr << "usage: " << argv[0] << " [-c config.json] [options]\n" << desc << std::endl;
        return EXIT_FAILURE;
    }

    tc::RunConfig cfg;
    try {
        if (vm.count("config")) {
            cfg = tc::RunConfig::load(vm["config"].as<std::string>());
        }
        cfg.applyLogging();
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        if (cfg.mpi) {
            MpiSession session(&argc, &argv);
            tc::MpiCoordinator coord;
            return runPipeline(cfg, coord, vm);
        }
        tc::SerialCoordinator coord;
        return runPipeline(cfg, coord, vm);
    } catch (const std::exception& e) {
        tc::Logger()->critical("Pipeline failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
