#include <cubeland/common/config.hpp>
#include <cubeland/gfx/host_mesh_uploader.hpp>
#include <cubeland/land/chunk_cache.hpp>
#include <cubeland/land/face_table.hpp>
#include <cubeland/util/elapsed_timer.hpp>
#include <cubeland/util/error_condition.hpp>
#include <cubeland/util/exception.hpp>
#include <cubeland/util/log.hpp>
#include <cubeland/version.hpp>

#include <cxxopts/cxxopts.hpp>
#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

using namespace cubeland;

namespace
{

const std::string CLI_SECTION_SEPARATOR = "__";

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("cubeland-chunkstat", "Generate a square of terrain chunks and report statistics");
	Config::Scheme scheme = Config::mainConfigScheme();

	for (Config::SchemeEntry &entry : scheme) {
		std::shared_ptr<cxxopts::Value> default_cli_value;
		switch (entry.default_value.index()) {
		case 0:
			static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
			default_cli_value = cxxopts::value<std::string>();
			break;

		case 1:
			static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
			default_cli_value = cxxopts::value<int64_t>();
			break;

		default:
			static_assert(std::variant_size_v<Config::option_t> == 2);
			break;
		}

		options.add_options(entry.section)(entry.section + CLI_SECTION_SEPARATOR + entry.parameter_name,
			entry.description, default_cli_value);
	}

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information")
		("version", "Display version and exit")
		("c,config", "Path to INI config file", cxxopts::value<std::string>()->default_value("cubeland.ini"))
		("center-x", "X index of the central chunk", cxxopts::value<int64_t>()->default_value("0"))
		("center-z", "Z index of the central chunk", cxxopts::value<int64_t>()->default_value("0"));
	// clang-format on

	return options;
}

void patchConfig(const cxxopts::ParseResult &result, Config &config)
{
	for (const auto &keyvalue : result.arguments()) {
		size_t sep_idx = keyvalue.key().find(CLI_SECTION_SEPARATOR);
		if (sep_idx == std::string::npos) {
			continue;
		}

		std::string section = keyvalue.key().substr(0, sep_idx);
		std::string parameter = keyvalue.key().substr(sep_idx + CLI_SECTION_SEPARATOR.size());

		config.patch(section, parameter, keyvalue.value());
	}
}

std::string makeVersionString()
{
	std::string text = fmt::format("{}.{}.{}", Version::MAJOR, Version::MINOR, Version::PATCH);

	if (std::string_view appendix = Version::SUFFIX; !appendix.empty()) {
		text += ' ';
		text += appendix;
	}

	if (std::string_view git_hash = Version::GIT_HASH; !git_hash.empty()) {
		text += " (git ";
		text += git_hash;
		text += ')';
	}

	return text;
}

template<typename T>
T checkedOption(int64_t value, std::string_view name)
{
	if (value < 0 || uint64_t(value) > uint64_t(std::numeric_limits<T>::max())) {
		throw Exception::fromError(CubelandErrc::InvalidData, fmt::format("option '{}' out of range", name).c_str());
	}

	return T(value);
}

struct Stats {
	size_t loaded_chunks = 0;
	size_t empty_chunks = 0;
	uint64_t quads = 0;
	std::array<uint64_t, land::NUM_FACE_ORIENTATIONS> quads_per_face = {};
	uint64_t opaque_blocks = 0;
};

int runChunkstat(const cxxopts::ParseResult &cli_opts)
{
	Config config(cli_opts["config"].as<std::string>(), Config::mainConfigScheme());
	patchConfig(cli_opts, config);

	const std::string level_name = config.getString("log", "level");
	if (auto level = Log::levelFromName(level_name); level) {
		Log::setLevel(*level);
	} else {
		Log::warn("Unknown log level '{}', keeping {}", level_name, Log::levelName(Log::level()));
	}

	const auto seed = checkedOption<uint32_t>(config.getInt64("world", "seed"), "world.seed");
	const auto radius = checkedOption<uint32_t>(config.getInt64("world", "visible_radius"), "world.visible_radius");
	if (radius == 0) {
		throw Exception::fromError(CubelandErrc::InvalidData, "visible radius must be positive");
	}

	const int64_t center_x = cli_opts["center-x"].as<int64_t>();
	const int64_t center_z = cli_opts["center-z"].as<int64_t>();

	Log::info("cubeland-chunkstat {}", makeVersionString());
	Log::info("Seed {}, visible radius {}, center chunk ({}, {})", seed, radius, center_x, center_z);

	gfx::HostMeshUploader uploader;
	land::ChunkCache cache(seed, uploader, land::ChunkCache::capacityForRadius(radius));

	ElapsedTimer timer;

	const int64_t r = int64_t(radius);
	for (int64_t ix = center_x - r; ix < center_x + r; ix++) {
		for (int64_t iz = center_z - r; iz < center_z + r; iz++) {
			const land::ChunkCoord coord = land::ChunkCoord::fromChunkIndex(ix, iz);
			cache.load(coord);
			cache.touch(coord);
		}
	}

	const int64_t load_us = timer.lapMicros();

	Stats stats;
	cache.forEachChunk([&](const land::Chunk &chunk) {
		stats.loaded_chunks++;

		const land::MeshBatches &mesh = chunk.mesh();
		if (mesh.empty()) {
			stats.empty_chunks++;
		}

		for (land::FaceOrientation orientation : land::ALL_FACE_ORIENTATIONS) {
			const uint64_t quads = mesh.range(orientation).num_indices / land::QUAD_INDICES.size();
			stats.quads_per_face[land::faceIndex(orientation)] += quads;
			stats.quads += quads;
		}

		stats.opaque_blocks += chunk.grid().numBlocks() - chunk.grid().count(land::BlockType::Air);
	});

	const gfx::HostMeshUploader::Stats &upload_stats = uploader.stats();

	fmt::print("chunks: {} loaded ({} empty), capacity {}\n", stats.loaded_chunks, stats.empty_chunks,
		cache.capacity());
	fmt::print("blocks: {} opaque\n", stats.opaque_blocks);
	fmt::print("quads: {} total, {:.2f} per opaque block\n", stats.quads,
		stats.opaque_blocks > 0 ? double(stats.quads) / double(stats.opaque_blocks) : 0.0);
	for (land::FaceOrientation orientation : land::ALL_FACE_ORIENTATIONS) {
		fmt::print("  {:>6}: {}\n", land::faceInfo(orientation).name,
			stats.quads_per_face[land::faceIndex(orientation)]);
	}
	fmt::print("buffers: {} uploads, {} releases, {} live ({} bytes)\n", upload_stats.uploads,
		upload_stats.releases, upload_stats.live_buffers, upload_stats.live_bytes);
	fmt::print("time: {} ms ({:.1f} us per chunk)\n", load_us / 1000,
		double(load_us) / double(stats.loaded_chunks > 0 ? stats.loaded_chunks : 1));

	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
	cxxopts::Options opts = makeCliOptions();
	cxxopts::ParseResult cli_opts;

	try {
		cli_opts = opts.parse(argc, argv);
	}
	catch (cxxopts::exceptions::exception &ex) {
		fmt::print(stderr, "Invalid options provided, use -h (--help) to get usage help.\nError details:\n{}\n",
			ex.what());
		return EXIT_FAILURE;
	}

	if (cli_opts.count("help")) {
		fmt::print("{}\n", opts.help());
		return EXIT_SUCCESS;
	}

	if (cli_opts.count("version")) {
		fmt::print("cubeland-chunkstat {}\n", makeVersionString());
		return EXIT_SUCCESS;
	}

	if (!cli_opts.unmatched().empty()) {
		fmt::print(stderr, "Unknown arguments provided: {}\n", fmt::join(cli_opts.unmatched(), " "));
		return EXIT_FAILURE;
	}

	try {
		return runChunkstat(cli_opts);
	}
	catch (const Exception &e) {
		Log::fatal("Uncaught cubeland::Exception instance");
		Log::fatal("what(): {}", e.what());
		auto loc = e.where();
		Log::fatal("where(): {}:{}", loc.file_name(), loc.line());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
}
