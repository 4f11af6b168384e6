// src/file_repairer.cpp
#include "file_repairer.hpp"
#include "diff_engine.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "patch_extractor.hpp"
#include "repair_errors.hpp"

namespace fs = std::filesystem;

namespace ChunkFix
{

    FileRepairer::FileRepairer(const Config::ChunkConfig &config, std::ostream &out) : config(config), out(out)
    {
        // Reject a bad chunk size before touching any file
        this->config.chunkBytes();
    }

    Manifest::DigestManifest FileRepairer::generateManifest(const fs::path &target)
    {
        const fs::path manifest_path = config.manifestPathFor(target);
        Logger::info("Generating manifest for " + target.string() + " with " + std::to_string(config.chunk_mib) +
                     " MiB chunks (" + Digest::algorithmName(config.algorithm) + ")");

        IO::ByteRangeReader reader(target);
        // Fully computed before the old manifest is replaced
        Manifest::DigestManifest manifest =
            Manifest::DigestManifest::generate(reader, config.chunk_mib, config.algorithm);
        manifest.save(manifest_path);
        manifest.write(out);

        Logger::info("Manifest written to " + manifest_path.string() + " (" + std::to_string(manifest.entries.size()) +
                     " chunks). Transfer it to the site holding the intact file.");
        return manifest;
    }

    Report::RepairReport FileRepairer::diffAndExtract(const fs::path &reference, const fs::path &report_path)
    {
        const fs::path manifest_path = config.manifestPathFor(reference);
        Manifest::DigestManifest manifest = Manifest::DigestManifest::load(manifest_path);

        IO::ByteRangeReader reader(reference);
        const Diff::DiffResult diff = Diff::DiffEngine::diffReference(manifest, reader, config);

        Chunks::PatchExtractor extractor(config);
        const auto artifacts = extractor.extract(reader, diff.offsetsToExtract(), manifest.algorithm);

        Report::RepairReport report =
            Report::RepairReport::fromDiff(diff, artifacts, manifest, reference.filename().string());
        if (!report_path.empty())
        {
            report.save(report_path);
            Logger::info("Repair report written to " + report_path.string());
        }

        if (diff.identical())
        {
            out << "Files are identical (" << diff.compared << " chunks compared); nothing to repair." << std::endl;
            return report;
        }
        if (diff.whole_file_mismatch)
        {
            out << "None of the " << diff.compared << " compared chunks match: no incremental repair is possible, "
                << "transfer the whole file again." << std::endl;
            return report;
        }

        out << diff.mismatched.size() << " of " << diff.compared << " compared chunks differ";
        if (!diff.mismatched.empty())
        {
            out << ": " << Layout::joinOffsets(diff.mismatched);
        }
        out << std::endl;
        if (diff.referenceLonger())
        {
            out << "The intact file is " << (diff.reference_size - diff.manifest_size)
                << " bytes longer than the damaged one; " << diff.appended.size()
                << " trailing chunk(s) extracted as new data." << std::endl;
        }
        if (diff.truncate_to)
        {
            out << "The damaged file is " << (diff.manifest_size - diff.reference_size)
                << " bytes too long and must be truncated to " << *diff.truncate_to << " bytes." << std::endl;
        }
        if (!artifacts.empty())
        {
            out << "Copy these files to the damaged side:";
            for (const auto &artifact : artifacts)
            {
                out << ' ' << artifact.getFullPath(config).filename().string();
            }
            out << std::endl;
        }
        out << "Then run there:" << std::endl;
        out << report.command << std::endl;
        return report;
    }

    Chunks::ApplyResult FileRepairer::repair(const fs::path &target, const Chunks::RepairPlan &plan)
    {
        if (plan.offsets.empty() && !plan.truncate_to)
        {
            Logger::info("Nothing to inject or truncate for " + target.string());
            Chunks::ApplyResult nothing;
            nothing.final_size = IO::fileSize(target);
            return nothing;
        }

        Chunks::PatchApplier applier(config);
        Chunks::ApplyResult result = applier.apply(target, plan);
        out << "Repaired " << target.string() << ": " << result.injected.size() << " chunk(s) injected";
        if (result.truncated_to)
        {
            out << ", truncated to " << *result.truncated_to << " bytes";
        }
        out << "; size is now " << result.final_size << " bytes." << std::endl;
        return result;
    }

    Chunks::ApplyResult FileRepairer::repairFromReport(const fs::path &target, const fs::path &report_path)
    {
        const Report::RepairReport report = Report::RepairReport::load(report_path);
        if (report.chunk_mib != config.chunk_mib)
        {
            throw ChunkSizeMismatchError(report.chunk_mib, config.chunk_mib);
        }
        if (target.filename().string() != report.file)
        {
            Logger::warning("Repair report was made for '" + report.file + "', applying it to " + target.string());
        }
        return repair(target, report.toPlan());
    }

    int runCommandLine(const Cli::CommandLine &cli, std::ostream &out)
    {
        Logger::setVerbose(cli.config.verbose);
        try
        {
            switch (cli.mode)
            {
            case Cli::Mode::Help:
                out << Cli::usageText();
                break;
            case Cli::Mode::Generate:
            {
                FileRepairer repairer(cli.config, out);
                repairer.generateManifest(cli.target);
                break;
            }
            case Cli::Mode::Diff:
            {
                FileRepairer repairer(cli.config, out);
                repairer.diffAndExtract(cli.target, cli.report_path);
                break;
            }
            case Cli::Mode::Repair:
            {
                Config::ChunkConfig config = cli.config;
                if (!cli.from_report.empty())
                {
                    // The report decides the chunk size unless the operator pinned one
                    if (!cli.chunk_explicit)
                    {
                        config.chunk_mib = Report::RepairReport::load(cli.from_report).chunk_mib;
                    }
                    FileRepairer repairer(config, out);
                    repairer.repairFromReport(cli.target, cli.from_report);
                }
                else
                {
                    Chunks::RepairPlan plan;
                    plan.offsets = cli.inject;
                    plan.truncate_to = cli.truncate_to;
                    FileRepairer repairer(config, out);
                    repairer.repair(cli.target, plan);
                }
                break;
            }
            }
        }
        catch (const RepairError &e)
        {
            Logger::error(e.what());
            return e.exitCode();
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("Unexpected failure: ") + e.what());
            return ExitCode::Io;
        }
        return ExitCode::Ok;
    }

} // namespace ChunkFix
