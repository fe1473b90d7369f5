#include <iostream>
#include <memory>
#include <string>
#include <random>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <opencv2/opencv.hpp>

#include "board_rules.hpp"
#include "board_view.hpp"
#include "backtracking_solver.hpp"
#include "cultural_solver.hpp"
#include "puzzle_generator.hpp"
#include "solve_driver.hpp"

namespace {

struct Options {
    int size = 9;
    std::string algo = "cultural";
    double difficulty = 0.5;
    std::optional<int> popSize;
    std::optional<double> eliteFrac;
    std::optional<int> maxIters;
    std::optional<std::uint32_t> seed;
    int delayMs = 0;
    std::string outPrefix;
    bool show = false;
    bool quiet = false;
    bool help = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --size N           grid size: 4, 6 or 9 (default 9)\n"
              << "  --algo NAME        cultural | backtracking (default cultural)\n"
              << "  --difficulty D     fraction of cells removed, 0..1 (default 0.5)\n"
              << "  --pop P            population size (default 150)\n"
              << "  --elite F          elite fraction (default 0.1)\n"
              << "  --iters I          iteration budget (default 2000, 1000 for N <= 6)\n"
              << "  --seed S           seed for puzzle and solver\n"
              << "  --delay-ms D       pause between solver steps\n"
              << "  --out PREFIX       write PREFIX_board.png and PREFIX_fitness.png\n"
              << "  --show             live window, q or ESC stops the solve\n"
              << "  --quiet            only print the result\n";
}

bool parseInt(const char* s, long long& out) {
    if (s == nullptr) return false;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

bool parseDouble(const char* s, double& out) {
    if (s == nullptr) return false;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

// Throws std::invalid_argument on unknown options or malformed values.
Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> const char* {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };
        auto intValue = [&]() {
            long long v = 0;
            if (!parseInt(value(), v)) throw std::invalid_argument("expected an integer for " + arg);
            return v;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--size") {
            opts.size = static_cast<int>(intValue());
        } else if (arg == "--algo") {
            opts.algo = value();
            if (opts.algo != "cultural" && opts.algo != "backtracking")
                throw std::invalid_argument("unknown algorithm " + opts.algo);
        } else if (arg == "--difficulty" || arg == "--elite") {
            double v = 0.0;
            if (!parseDouble(value(), v)) throw std::invalid_argument("expected a number for " + arg);
            if (arg == "--difficulty") opts.difficulty = v;
            else opts.eliteFrac = v;
        } else if (arg == "--pop") {
            opts.popSize = static_cast<int>(intValue());
        } else if (arg == "--iters") {
            opts.maxIters = static_cast<int>(intValue());
        } else if (arg == "--seed") {
            opts.seed = static_cast<std::uint32_t>(intValue());
        } else if (arg == "--delay-ms") {
            opts.delayMs = static_cast<int>(intValue());
        } else if (arg == "--out") {
            opts.outPrefix = value();
        } else if (arg == "--show") {
            opts.show = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    if (!isSupportedSize(opts.size)) throw std::invalid_argument("--size must be 4, 6 or 9");
    if (opts.delayMs < 0) throw std::invalid_argument("--delay-ms must not be negative");
    return opts;
}

std::unique_ptr<SolverStrategy> makeStrategy(const Options& opts) {
    if (opts.algo == "backtracking") return std::make_unique<BacktrackingStrategy>();

    CulturalConfig config = CulturalConfig::forGridSize(opts.size);
    if (opts.popSize) config.popSize = *opts.popSize;
    if (opts.eliteFrac) config.eliteFrac = *opts.eliteFrac;
    if (opts.maxIters) config.maxIters = *opts.maxIters;
    config.seed = opts.seed;
    return std::make_unique<CulturalStrategy>(config);
}

} // namespace

int main(int argc, char* argv[]) {
    const char* windowName = "Sudoku AI Solver";

    try {
        Options opts = parseArgs(argc, argv);
        if (opts.help) {
            printUsage(argv[0]);
            return 0;
        }

        std::mt19937 rng(opts.seed ? *opts.seed : std::random_device{}());
        Board puzzle = generatePuzzle(opts.size, rng, opts.difficulty);

        std::cout << "Solving puzzle:\n";
        printBoard(puzzle, std::cout);

        std::unique_ptr<SolverStrategy> strategy = makeStrategy(opts);
        BoardView view(puzzle);
        SolveDriver driver(strategy->begin(puzzle), std::chrono::milliseconds(opts.delayMs));

        bool solved = false;
        auto onStep = [&](const SolveStep& step) {
            view.apply(step);
            if (step.kind == StepKind::Done) solved = true;
            if (opts.quiet) return;
            if (step.kind == StepKind::Iter && step.iteration % 100 == 0)
                std::cout << "Generation " << step.iteration << ": best fitness " << step.fitness << std::endl;
            else if (step.kind == StepKind::Init)
                std::cout << "Initial population best fitness " << step.fitness << std::endl;
        };

        auto start = std::chrono::high_resolution_clock::now();
        driver.start();
        while (!driver.finished()) {
            driver.waitAndPoll(onStep, std::chrono::milliseconds(30));
            if (opts.show) {
                cv::imshow(windowName, view.render());
                int key = cv::waitKey(1);
                if (key == 'q' || key == 27) driver.stop();
            }
        }
        driver.join(onStep);
        auto end = std::chrono::high_resolution_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        std::cout << "\nStatus: " << (driver.stopRequested() && !solved ? "Stopped" : view.status()) << "\n";
        std::cout << strategy->name() << " took: " << ms << " ms\n\n";
        printBoard(view.board(), std::cout);

        cv::Mat boardImage = view.render();
        cv::Mat plot = renderFitnessPlot(view.fitnessHistory());
        if (!opts.outPrefix.empty()) {
            saveImage(opts.outPrefix + "_board.png", boardImage);
            std::cout << "Saved: " << opts.outPrefix << "_board.png" << std::endl;
            if (!view.fitnessHistory().empty()) {
                saveImage(opts.outPrefix + "_fitness.png", plot);
                std::cout << "Saved: " << opts.outPrefix << "_fitness.png" << std::endl;
            }
        }
        if (opts.show) {
            cv::imshow(windowName, boardImage);
            if (!view.fitnessHistory().empty()) cv::imshow("Fitness Graph", plot);
            cv::waitKey(0);
            cv::destroyAllWindows();
        }

        return solved ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }
}
