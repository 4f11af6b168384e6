// src/command_line.cpp
#include "command_line.hpp"
#include "chunk_layout.hpp"
#include "repair_errors.hpp"

#include <sstream>

namespace ChunkFix
{
    namespace Cli
    {

        namespace
        {
            struct OptionSpec
            {
                char short_name;
                const char *long_name;
                bool takes_value;
            };

            const OptionSpec OPTIONS[] = {
                {'d', "diff", false},
                {'m', "manifest", true},
                {'c', "chunk-mib", true},
                {'a', "algorithm", true},
                {'o', "artifact-dir", true},
                {'i', "inject", true},
                {'t', "truncate", true},
                {'r', "report", true},
                {'R', "from-report", true},
                {'v', "verbose", false},
                {'h', "help", false},
            };

            const OptionSpec *findShort(char name)
            {
                for (const auto &spec : OPTIONS)
                {
                    if (spec.short_name == name)
                        return &spec;
                }
                return nullptr;
            }

            const OptionSpec *findLong(const std::string &name)
            {
                for (const auto &spec : OPTIONS)
                {
                    if (name == spec.long_name)
                        return &spec;
                }
                return nullptr;
            }

            uint64_t numberArg(const std::string &value, const char *what)
            {
                uint64_t number = 0;
                if (!Layout::parseU64(value, number))
                {
                    throw UsageError(std::string("Invalid ") + what + " '" + value + "': expected a non-negative integer");
                }
                return number;
            }
        } // namespace

        CommandLine parseCommandLine(int argc, const char *const argv[])
        {
            CommandLine cli;
            bool diff = false;
            bool help = false;
            bool options_done = false;
            std::vector<std::string> positional;

            for (int i = 1; i < argc; ++i)
            {
                const std::string arg = argv[i];

                if (options_done || arg.size() < 2 || arg[0] != '-')
                {
                    positional.push_back(arg);
                    continue;
                }
                if (arg == "--")
                {
                    options_done = true;
                    continue;
                }

                const OptionSpec *spec = nullptr;
                std::optional<std::string> value;
                if (arg[1] == '-')
                {
                    std::string name = arg.substr(2);
                    const auto eq = name.find('=');
                    if (eq != std::string::npos)
                    {
                        value = name.substr(eq + 1);
                        name = name.substr(0, eq);
                    }
                    spec = findLong(name);
                }
                else
                {
                    spec = findShort(arg[1]);
                    if (spec && arg.size() > 2)
                    {
                        value = arg.substr(2); // -c5
                    }
                }

                if (!spec)
                {
                    throw UsageError("Unknown option '" + arg + "'");
                }
                if (spec->takes_value && !value)
                {
                    if (i + 1 >= argc)
                    {
                        throw UsageError(std::string("Option --") + spec->long_name + " needs a value");
                    }
                    value = argv[++i];
                }
                if (!spec->takes_value && value)
                {
                    throw UsageError(std::string("Option --") + spec->long_name + " takes no value");
                }

                switch (spec->short_name)
                {
                case 'd':
                    diff = true;
                    break;
                case 'm':
                    cli.config.manifest_path = *value;
                    break;
                case 'c':
                    cli.config.chunk_mib = numberArg(*value, "chunk size");
                    if (cli.config.chunk_mib == 0)
                    {
                        throw ValidationError("Chunk size must be a positive number of MiB");
                    }
                    cli.chunk_explicit = true;
                    break;
                case 'a':
                    if (!Digest::parseAlgorithm(*value, cli.config.algorithm))
                    {
                        throw UsageError("Unknown digest algorithm '" + *value + "' (use md5, sha1 or sha256)");
                    }
                    cli.config.algorithm_explicit = true;
                    break;
                case 'o':
                    cli.config.artifact_dir = *value;
                    break;
                case 'i':
                    try
                    {
                        const auto offsets = Layout::parseOffsetList(*value);
                        cli.inject.insert(cli.inject.end(), offsets.begin(), offsets.end());
                    }
                    catch (const ValidationError &e)
                    {
                        throw UsageError(e.what());
                    }
                    break;
                case 't':
                    cli.truncate_to = numberArg(*value, "truncation length");
                    break;
                case 'r':
                    cli.report_path = *value;
                    break;
                case 'R':
                    cli.from_report = *value;
                    break;
                case 'v':
                    cli.config.verbose = true;
                    break;
                case 'h':
                    help = true;
                    break;
                }
            }

            if (help)
            {
                cli.mode = Mode::Help;
                return cli;
            }

            if (positional.empty())
            {
                throw UsageError("Missing file argument");
            }
            if (positional.size() > 1)
            {
                throw UsageError("Expected exactly one file argument, got " + std::to_string(positional.size()));
            }
            cli.target = positional.front();

            const bool repair = !cli.inject.empty() || cli.truncate_to || !cli.from_report.empty();
            if (diff && repair)
            {
                throw UsageError("--diff cannot be combined with --inject, --truncate or --from-report");
            }
            if (!cli.from_report.empty() && (!cli.inject.empty() || cli.truncate_to))
            {
                throw UsageError("--from-report already carries the offsets and truncation; drop -i/-t");
            }
            if (!cli.report_path.empty() && !diff)
            {
                throw UsageError("--report is only meaningful with --diff");
            }

            if (diff)
                cli.mode = Mode::Diff;
            else if (repair)
                cli.mode = Mode::Repair;
            else
                cli.mode = Mode::Generate;
            return cli;
        }

        std::string usageText()
        {
            std::ostringstream out;
            out << "Usage: " << Config::ChunkConfig::PROGRAM_NAME << " [options] <file>\n"
                << "\n"
                << "Repairs a damaged copy of a large file by exchanging per-chunk digests and\n"
                << "only the chunks that differ.\n"
                << "\n"
                << "  1. damaged side:   " << Config::ChunkConfig::PROGRAM_NAME << " <file>\n"
                << "                     (writes <file>" << Config::ChunkConfig::MANIFEST_SUFFIX << ")\n"
                << "  2. reference side: " << Config::ChunkConfig::PROGRAM_NAME << " -d <file>\n"
                << "                     (writes " << Config::ChunkConfig::ARTIFACT_PREFIX
                << "<n> files and prints the repair command)\n"
                << "  3. damaged side:   run the printed command next to the " << Config::ChunkConfig::ARTIFACT_PREFIX
                << "<n> files\n"
                << "\n"
                << "Options:\n"
                << "  -d, --diff               diff <file> against the manifest and extract chunks\n"
                << "  -m, --manifest PATH      manifest path (default <file>" << Config::ChunkConfig::MANIFEST_SUFFIX
                << ")\n"
                << "  -c, --chunk-mib N        chunk size in MiB (default " << Config::ChunkConfig::DEFAULT_CHUNK_MIB
                << ")\n"
                << "  -a, --algorithm NAME     md5, sha1 or sha256 (default md5)\n"
                << "  -o, --artifact-dir DIR   where " << Config::ChunkConfig::ARTIFACT_PREFIX
                << "<n> files are written and read (default .)\n"
                << "  -i, --inject LIST        comma-separated chunk offsets to inject into <file>\n"
                << "  -t, --truncate BYTES     shrink <file> to BYTES after injecting\n"
                << "  -r, --report PATH        with -d, also write a JSON repair report\n"
                << "  -R, --from-report PATH   repair using a JSON repair report\n"
                << "  -v, --verbose            debug logging\n"
                << "  -h, --help               show this text\n"
                << "\n"
                << "Exit status: 0 ok, 1 usage error, 2 validation error, 3 I/O error,\n"
                << "4 digest not available on this host.\n";
            return out.str();
        }

    } // namespace Cli
} // namespace ChunkFix
