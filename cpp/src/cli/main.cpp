// =============================================================================
// curdecomp CLI - CUR decomposition from the command line
// =============================================================================
//
// Usage:
//   curdecomp [global options] <command> [options]
//
// Commands:
//   select      Select columns/rows and report the reconstruction loss
//   loss        Print the loss curve for 1..N selected columns
//   project     Write the latent-space projector for N columns
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   curdecomp select -i features.txt -c 10 --feature-select
//   curdecomp select -i kernel.txt -c 5 --method pcovr -y props.txt --alpha 0.5
//   curdecomp loss -i data.txt -c 20 -r 20
//   curdecomp project -i kernel.txt -c 8 -o projector.txt
//
// =============================================================================

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "curdecomp/config.hpp"
#include "curdecomp/cur_config.hpp"
#include "curdecomp/cur.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/io/matrix_io.hpp"
#include "curdecomp/logging.hpp"

namespace curdecomp::cli {
    int cmd_select(int argc, char* argv[]);
    int cmd_loss(int argc, char* argv[]);
    int cmd_project(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define CURDECOMP_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"select",  "Select columns/rows and report the reconstruction loss", curdecomp::cli::cmd_select},
    {"loss",    "Print the loss curve for 1..N selected columns", curdecomp::cli::cmd_loss},
    {"project", "Write the latent-space projector for N columns", curdecomp::cli::cmd_project},
    {"version", "Show version information", curdecomp::cli::cmd_version},
    {"help",    "Show this help message", curdecomp::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// Per-command options shared by select/loss/project
struct JobOptions {
    std::string input;
    std::string properties;
    std::string output;
    std::string method;
    std::optional<double> alpha;
    std::optional<curdecomp::Index> rank;
    curdecomp::Index columns = 0;
    std::optional<curdecomp::Index> rows;
    bool feature_select = false;
};

static bool parse_job_options(int argc, char* argv[], JobOptions& job) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw curdecomp::UsageError("Missing value for option " + arg);
            }
            return argv[++i];
        };

        try {
            if (arg == "-i" || arg == "--input") {
                job.input = next();
            } else if (arg == "-y" || arg == "--properties") {
                job.properties = next();
            } else if (arg == "-o" || arg == "--output") {
                job.output = next();
            } else if (arg == "-m" || arg == "--method") {
                job.method = next();
            } else if (arg == "-a" || arg == "--alpha") {
                job.alpha = std::stod(next());
            } else if (arg == "-k" || arg == "--rank") {
                job.rank = std::stol(next());
            } else if (arg == "-c" || arg == "--columns") {
                job.columns = std::stol(next());
            } else if (arg == "-r" || arg == "--rows") {
                job.rows = std::stol(next());
            } else if (arg == "-f" || arg == "--feature-select") {
                job.feature_select = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::invalid_argument&) {
            std::cerr << "Option " << arg << " expects a number\n";
            return false;
        } catch (const std::out_of_range&) {
            std::cerr << "Option " << arg << " value out of range\n";
            return false;
        }
    }

    if (job.input.empty() || job.columns < 1) {
        std::cerr << "Required: --input <file> and --columns <n >= 1>\n";
        return false;
    }
    return true;
}

static curdecomp::CUR build_cur(const JobOptions& job) {
    curdecomp::CurOptions options = curdecomp::options_from_config();
    if (!job.method.empty()) options.pi_function = job.method;
    if (job.rank) options.params.rank = *job.rank;
    options.params.alpha = job.alpha;
    if (!job.properties.empty()) {
        options.params.properties = curdecomp::io::MatrixIO::load(job.properties);
    }
    options.feature_select = job.feature_select;

    return curdecomp::CUR(curdecomp::io::MatrixIO::load(job.input), std::move(options));
}

static void print_indices(const char* label, const curdecomp::Indices& idx) {
    std::cout << label << ":";
    for (auto j : idx) std::cout << ' ' << j;
    std::cout << "\n";
}

// =============================================================================
// Commands
// =============================================================================

namespace curdecomp::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "curdecomp - CUR matrix decomposition\n";
    std::cout << "Version " << CURDECOMP_VERSION_STRING << "\n\n";
    std::cout << "Usage: curdecomp [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  --config <file>         key = value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  -i, --input <file>      Matrix to decompose (text, one row per line)\n";
    std::cout << "  -c, --columns <n>       Number of columns to select\n";
    std::cout << "  -r, --rows <n>          Number of rows (required unless symmetric or -f)\n";
    std::cout << "  -m, --method <name>     svd (default) or pcovr\n";
    std::cout << "  -k, --rank <k>          Leading vectors used for scoring (default: 1)\n";
    std::cout << "  -y, --properties <file> Property matrix Y for pcovr\n";
    std::cout << "  -a, --alpha <a>         PCovR mixing weight in [0, 1]\n";
    std::cout << "  -f, --feature-select    Select columns only\n";
    std::cout << "  -o, --output <file>     Output file (project)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  CUR_LOG_LEVEL, CUR_LOG_FILE, CUR_SELECTION_METHOD, CUR_SELECTION_RANK,\n";
    std::cout << "  CUR_REGULARIZATION, CUR_SYMMETRY_TOLERANCE, CUR_PROJECTOR_THRESHOLD\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "curdecomp " << CURDECOMP_VERSION_STRING << "\n";
    std::cout << "Eigen " << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "."
              << EIGEN_MINOR_VERSION << "\n";
    return 0;
}

int cmd_select(int argc, char* argv[]) {
    JobOptions job;
    if (!parse_job_options(argc, argv, job)) return 1;

    CUR cur = build_cur(job);
    const Decomposition d = cur.compute(job.columns, job.rows);

    print_indices("columns", d.idx_c);
    if (!cur.feature_select()) print_indices("rows", d.idx_r);
    std::cout << "symmetric: " << (cur.symmetric() ? "yes" : "no") << "\n";
    std::cout << "loss: " << std::setprecision(10)
              << relative_error(cur.matrix(), d.reconstruct()) << "\n";
    if (!d.complete) {
        std::cout << "note: selection exhausted before the requested count\n";
    }
    return 0;
}

int cmd_loss(int argc, char* argv[]) {
    JobOptions job;
    if (!parse_job_options(argc, argv, job)) return 1;

    CUR cur = build_cur(job);
    std::cout << "# n_c loss\n";
    for (Index n = 1; n <= job.columns; ++n) {
        std::optional<Index> n_r;
        if (job.rows) n_r = std::min(n, *job.rows);
        std::cout << n << ' ' << std::setprecision(10) << cur.loss(n, n_r) << "\n";
    }
    return 0;
}

int cmd_project(int argc, char* argv[]) {
    JobOptions job;
    if (!parse_job_options(argc, argv, job)) return 1;

    CUR cur = build_cur(job);
    const Decomposition d = cur.compute(job.columns, job.rows);
    const double thresh = Config::getInstance().get<double>("projector.threshold", kProjectorThreshold);
    const Matrix P = compute_projector(d.A_c, d.S, d.A_r, thresh);

    if (job.output.empty()) {
        io::MatrixIO::write(std::cout, P);
    } else {
        io::MatrixIO::save(job.output, P);
        if (!g_options.quiet) {
            std::cout << "Wrote " << P.rows() << "x" << P.cols() << " projector to " << job.output << "\n";
        }
    }
    return 0;
}

} // namespace curdecomp::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!curdecomp::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) curdecomp::set_log_level(curdecomp::LogLevel::DEBUG);
    if (g_options.quiet) curdecomp::set_log_level(curdecomp::LogLevel::ERROR);

    if (argc < 1) {
        curdecomp::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const curdecomp::CurException& e) {
                std::cerr << e.what() << "\n";
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'curdecomp help' for usage.\n";
    return 1;
}
