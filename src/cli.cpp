#include "warden/cli.hpp"
#include "warden/config.hpp"
#include "warden/http_transport.hpp"
#include "warden/license_manager.hpp"
#include "warden/prompt_provider.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>

namespace warden::cli
{
	namespace
	{
		constexpr int kExitOk = 0;
		constexpr int kExitFailed = 1;
		constexpr int kExitUsage = 2;
		constexpr int kExitConfig = 3;

		void setup_logging(const std::string &level_name, bool quiet)
		{
			auto logger = spdlog::stderr_color_mt("warden");
			spdlog::set_default_logger(logger);

			auto level = spdlog::level::from_str(level_name);
			if (level == spdlog::level::off && level_name != "off")
			{
				level = spdlog::level::info;
			}
			if (quiet && level < spdlog::level::warn)
			{
				level = spdlog::level::warn;
			}
			spdlog::set_level(level);
		}

		std::string masked(const LicensePayload &payload)
		{
			auto j = payload.to_json();
			j["license_key"] = mask_license_key(payload.license_key);
			return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Warden license activation client"};
		app.require_subcommand(0, 1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		bool force = false;
		bool quiet = false;
		bool no_cache = false;
		bool no_persist = false;
		bool stateless = false;
		// verify is also the default, so its flags are accepted without the subcommand
		auto add_verify_flags = [&](CLI::App *target)
		{
			target->add_flag("--force", force, "Prompt for a license even if one is cached");
			target->add_flag("--quiet", quiet, "Never prompt; fail instead of blocking on input");
			target->add_flag("--no-cache", no_cache, "Ignore any cached activation");
			target->add_flag("--no-persist", no_persist, "Do not write the verified license to disk");
			target->add_flag("--stateless", stateless, "Shortcut for --no-cache --no-persist");
		};
		add_verify_flags(&app);
		auto verify_cmd = app.add_subcommand("verify", "Ensure this installation holds a verified license (default)");
		add_verify_flags(verify_cmd);

		std::string check_key;
		std::string check_email;
		auto check_cmd = app.add_subcommand("check", "Verify explicit credentials once against the server");
		check_cmd->add_option("--license-key", check_key, "License key")->required();
		check_cmd->add_option("--email", check_email, "Registered email");

		auto status_cmd = app.add_subcommand("status", "Show the cached activation");
		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective configuration as JSON");

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			return app.exit(e) == 0 ? kExitOk : kExitUsage;
		}

		auto dotenv = ConfigLoader::load_dotenv(".env");
		if (!dotenv)
		{
			std::cerr << dotenv.error().what() << std::endl;
		}

		auto cfg = config_path.empty() ? ConfigLoader::from_environment() : ConfigLoader::load(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return kExitConfig;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return kExitOk;
		}

		setup_logging(cfg->log_level, quiet);

		if (stateless)
		{
			no_cache = true;
			no_persist = true;
		}

		std::shared_ptr<PromptProvider> prompt;
		if (quiet)
			prompt = std::make_shared<NullPromptProvider>();
		else
			prompt = std::make_shared<ConsolePromptProvider>(std::cin, std::cerr, std::cerr);

		auto manager = LicenseManager::create(*cfg, std::make_shared<BeastHttpTransport>(), prompt);
		if (!manager)
		{
			std::cerr << manager.error().what() << std::endl;
			return kExitConfig;
		}

		if (*check_cmd)
		{
			auto key = normalize_license_key(check_key);
			if (key.empty())
			{
				std::cerr << "A license key is required" << std::endl;
				return kExitUsage;
			}
			std::optional<std::string> email;
			if (!check_email.empty())
				email = check_email;

			auto outcome = manager->verify_direct(key, email);
			if (!outcome.ok)
			{
				std::cerr << humanize_error(outcome.error_code) << std::endl;
				return kExitFailed;
			}
			std::cout << outcome.license.dump(2) << std::endl;
			return kExitOk;
		}

		if (*status_cmd)
		{
			auto cached = manager->load_cached_license();
			if (!cached)
			{
				std::cout << "No cached license" << std::endl;
				return kExitFailed;
			}
			std::cout << masked(*cached) << std::endl;
			return kExitOk;
		}

		// verify, explicit or by default
		VerifyOptions options;
		options.force_prompt = force || no_cache;
		options.quiet = quiet;
		options.skip_cache = no_cache;
		options.persist_cache = !no_persist;

		auto license = manager->ensure_valid_license(options);
		if (!license)
		{
			spdlog::error("{}", license.error().what());
			return kExitFailed;
		}
		std::cout << masked(*license) << std::endl;
		return kExitOk;
	}

} // namespace warden::cli
