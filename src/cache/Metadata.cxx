// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Metadata.hxx"
#include "time/ISO8601.hxx"

#include <nlohmann/json.hpp>

void
to_json(nlohmann::json &j, const CacheMetadata &metadata)
{
	j = nlohmann::json{
		{"Source", metadata.source},
		{"Status", metadata.status},
		{"ContentType", metadata.content_type},
		{"LastModified", FormatISO8601(metadata.last_modified)},
		{"Retrieved", FormatISO8601(metadata.retrieved)},
		{"ETag", metadata.etag},
		{"Size", metadata.size},
	};
}

static std::chrono::system_clock::time_point
GetTime(const nlohmann::json &j, const char *name)
{
	return ParseISO8601(j.at(name).get_ref<const std::string &>());
}

void
from_json(const nlohmann::json &j, CacheMetadata &metadata)
{
	j.at("Source").get_to(metadata.source);
	j.at("Status").get_to(metadata.status);
	j.at("ContentType").get_to(metadata.content_type);
	metadata.last_modified = GetTime(j, "LastModified");
	metadata.retrieved = GetTime(j, "Retrieved");
	j.at("ETag").get_to(metadata.etag);
	j.at("Size").get_to(metadata.size);
}

std::string
SerializeCacheMetadata(const CacheMetadata &metadata)
{
	std::string s = nlohmann::json(metadata).dump();
	s.push_back('\n');
	return s;
}

CacheMetadata
ParseCacheMetadata(std::string_view s)
{
	return nlohmann::json::parse(s).get<CacheMetadata>();
}
