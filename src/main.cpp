#include "deploy_decoder.hpp"

#include <cstdio>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::vector<spdlog::sink_ptr> sinks;

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    sinks.push_back(console_sink);

    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);
    if(!ec)
    {
        const std::string log_name = ddc::utils::currentTimestamp() + "-DeployDecoder.log";
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (logs_path / log_name).string(), true);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        sinks.push_back(file_sink);
    }

    spdlog::logger logger("multi_sink", sinks.begin(), sinks.end());
    logger.set_level(spdlog::level::debug);
    logger.flush_on(spdlog::level::info);

    spdlog::set_default_logger(std::make_shared<spdlog::logger>(logger));

    if(ec)
    {
        spdlog::warn("Cannot create logs directory {}: {}", logs_path.string(), ec.message());
    }
}

static void _printJson(const nlohmann::json & value, int indent)
{
    const std::string text = value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    std::printf("%s\n", text.c_str());
    std::fflush(stdout);
}

/*
    Batch lines have the form `<call data>[,<sender>]`.
*/
static ddc::engine::DecodeRequest _parseBatchLine(const std::string & line)
{
    ddc::engine::DecodeRequest request;

    const auto comma = line.rfind(',');
    if(comma != std::string::npos && ddc::utils::isAddress(ddc::utils::trim(std::string_view(line).substr(comma + 1))))
    {
        request.call_data = std::string(ddc::utils::trim(std::string_view(line).substr(0, comma)));
        request.sender = std::string(ddc::utils::trim(std::string_view(line).substr(comma + 1)));
        return request;
    }

    request.call_data = line;
    return request;
}

int main(int argc, char* argv[])
{
    ddc::config::Config cfg = ddc::config::makeDefaultConfig(std::filesystem::path(argv[0]).parent_path());

    _configureLogger(cfg.logs_path);

    spdlog::debug("Version: {}.{}.{}", ddc::MAJOR_VERSION, ddc::MINOR_VERSION, ddc::PATCH_VERSION);

    spdlog::debug("Deploy decoder started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    ddc::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", ddc::cmd::CommandLineArgDef::NArgs::Zero, ddc::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", ddc::cmd::CommandLineArgDef::NArgs::Zero, ddc::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", ddc::cmd::CommandLineArgDef::NArgs::Zero, ddc::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--abi", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Function interface ABI JSON file");
    arg_parser.addArg("--function", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Function to look up in the ABI (default deployToken)");
    arg_parser.addArg("--labels", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Address label table JSON file");
    arg_parser.addArg("--layout", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Positional payload layout JSON file");
    arg_parser.addArg("--input", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Transaction input to decode");
    arg_parser.addArg("--from", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "Transaction sender address");
    arg_parser.addArg("--batch", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::String, "File with one '<input>[,<sender>]' per line");
    arg_parser.addArg("--threads", ddc::cmd::CommandLineArgDef::NArgs::One, ddc::cmd::CommandLineArgDef::Type::Int, "Worker threads for batch decoding");

    if(const auto parse_res = arg_parser.parse(argc, argv); !parse_res)
    {
        spdlog::error("{}", parse_res.error().message);
        spdlog::info(arg_parser.constructHelpMessage());
        return 1;
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Version: {}.{}.{}", ddc::MAJOR_VERSION, ddc::MINOR_VERSION, ddc::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 0;
    }

    if(const auto abi_arg = arg_parser.getArg<std::vector<std::string>>("--abi")) cfg.abi_path = abi_arg->at(0);
    if(const auto function_arg = arg_parser.getArg<std::vector<std::string>>("--function")) cfg.function_name = function_arg->at(0);
    if(const auto labels_arg = arg_parser.getArg<std::vector<std::string>>("--labels")) cfg.labels_path = labels_arg->at(0);
    if(const auto layout_arg = arg_parser.getArg<std::vector<std::string>>("--layout")) cfg.legacy_layout_path = layout_arg->at(0);

    const auto function_res = ddc::config::loadFunctionInterface(cfg.abi_path, cfg.function_name);
    if(!function_res)
    {
        spdlog::error(std::format("Failed to load function interface: {}: {}", function_res.error().kind, function_res.error().message));
        return 1;
    }
    spdlog::info("Function interface: {}", function_res->signature());

    ddc::legacy::LegacyLayout legacy_layout;
    if(std::filesystem::exists(cfg.legacy_layout_path))
    {
        const auto layout_res = ddc::config::loadLegacyLayout(cfg.legacy_layout_path);
        if(!layout_res)
        {
            spdlog::error(std::format("Failed to load legacy layout: {}: {}", layout_res.error().kind, layout_res.error().message));
            return 1;
        }
        legacy_layout = *layout_res;
    }
    else
    {
        spdlog::warn("No legacy layout at {}, using default slot positions", cfg.legacy_layout_path.string());
    }

    ddc::labels::AddressLabeler labeler;
    if(std::filesystem::exists(cfg.labels_path))
    {
        auto labels_res = ddc::config::loadAddressLabels(cfg.labels_path);
        if(!labels_res)
        {
            spdlog::error(std::format("Failed to load address labels: {}: {}", labels_res.error().kind, labels_res.error().message));
            return 1;
        }
        labeler = std::move(*labels_res);
    }
    else
    {
        spdlog::warn("No address labels at {}", cfg.labels_path.string());
    }

    const ddc::engine::Engine engine(*function_res, legacy_layout, labeler);

    const auto input_arg = arg_parser.getArg<std::vector<std::string>>("--input");
    const auto batch_arg = arg_parser.getArg<std::vector<std::string>>("--batch");

    if(input_arg.has_value() == batch_arg.has_value())
    {
        spdlog::error("Exactly one of --input and --batch must be provided");
        return 1;
    }

    if(input_arg)
    {
        std::optional<std::string> sender;
        if(const auto from_arg = arg_parser.getArg<std::vector<std::string>>("--from"))
        {
            if(!ddc::utils::isAddress(from_arg->at(0)))
            {
                spdlog::error("Invalid --from address '{}'", from_arg->at(0));
                return 1;
            }
            sender = from_arg->at(0);
        }

        const auto record_res = engine.decode(input_arg->at(0), sender);
        if(!record_res)
        {
            _printJson(ddc::report::toJson(record_res.error()), 2);
            return 2;
        }

        _printJson(ddc::report::toJson(*record_res), 2);
        return 0;
    }

    const auto lines = ddc::file::loadLines(batch_arg->at(0));
    if(!lines)
    {
        return 1;
    }

    std::vector<ddc::engine::DecodeRequest> requests;
    requests.reserve(lines->size());
    for(const auto & line : *lines)
    {
        requests.push_back(_parseBatchLine(line));
    }

    const int threads = arg_parser.getArg<std::vector<int>>("--threads").value_or(std::vector<int>{4}).at(0);
    if(threads <= 0)
    {
        spdlog::error("Invalid --threads value");
        return 1;
    }

    spdlog::info("Decoding {} payloads on {} threads", requests.size(), threads);
    const auto results = engine.decodeBatch(requests, static_cast<std::size_t>(threads));

    std::size_t failures = 0;
    for(const auto & result : results)
    {
        if(result)
        {
            _printJson(ddc::report::toJson(*result), -1);
        }
        else
        {
            ++failures;
            _printJson(ddc::report::toJson(result.error()), -1);
        }
    }

    spdlog::info("Decoded {} of {} payloads", results.size() - failures, results.size());
    return failures == 0 ? 0 : 2;
}
