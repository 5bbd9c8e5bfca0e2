#include <spdlog/spdlog.h>

#include "lusolve_shell/app.hpp"

int main(int argc, char** argv) {
		spdlog::set_pattern("%^%l%$: %v");

		lusolve_shell::Options opts;
		switch (lusolve_shell::parse_args(argc, argv, &opts)) {
		case lusolve_shell::ArgsStatus::Ok:
				break;
		case lusolve_shell::ArgsStatus::Help:
				lusolve_shell::print_usage(argv[0]);
				return lusolve_shell::kExitOk;
		case lusolve_shell::ArgsStatus::Invalid:
				lusolve_shell::print_usage(argv[0]);
				return lusolve_shell::kExitUsage;
		}

		static lusolve_shell::App app;
		if (!app.init(opts))
				return lusolve_shell::kExitUsage;
		return app.run();
}
