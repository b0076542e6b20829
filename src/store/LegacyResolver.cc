/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "LegacyResolver.hh"
#include "BlobStore.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace shg {
namespace {

const LegacyResolver::Strategy all_strategies[] = {
	LegacyResolver::Strategy::exact,
	LegacyResolver::Strategy::strip_number,
	LegacyResolver::Strategy::after_dash,
	LegacyResolver::Strategy::tokens,
	LegacyResolver::Strategy::normalized
};

// "1589000000-roof.jpg" -> "roof.jpg"
std::string_view strip_number_prefix(std::string_view name)
{
	auto digits = std::find_if(name.begin(), name.end(), [](unsigned char c){return !std::isdigit(c);}) - name.begin();
	if (digits > 0 && static_cast<std::size_t>(digits) < name.size() && name[digits] == '-')
		name.remove_prefix(digits + 1);
	return name;
}

// "report__roof.jpg" -> "roof.jpg"
std::string_view strip_tag_prefix(std::string_view name)
{
	if (auto pos = name.find("__"); pos != name.npos)
		name.remove_prefix(pos + 2);
	return name;
}

std::vector<std::string> alnum_tokens(std::string_view name)
{
	std::vector<std::string> result;
	std::string current;
	for (unsigned char c : name)
	{
		if (std::isalnum(c))
			current.push_back(static_cast<char>(std::tolower(c)));
		else if (!current.empty())
		{
			result.push_back(current);
			current.clear();
		}
	}
	if (!current.empty())
		result.push_back(std::move(current));
	return result;
}

bool contains(std::string_view haystack, std::string_view needle)
{
	return !needle.empty() && haystack.find(needle) != haystack.npos;
}

} // end of local namespace

LegacyResolver::LegacyResolver(const BlobStore& store) : m_store{store}
{
}

std::string LegacyResolver::normalize(std::string_view name)
{
	std::string result;
	for (unsigned char c : name)
		if (std::isalnum(c))
			result.push_back(static_cast<char>(std::tolower(c)));
	return result;
}

bool LegacyResolver::match(Strategy strategy, std::string_view name, const BlobInfo& blob)
{
	std::string_view filename{blob.filename};
	switch (strategy)
	{
	case Strategy::exact:
		return filename == name || blob.field(meta::original_name) == name;

	case Strategy::strip_number:
		return contains(filename, strip_number_prefix(name));

	case Strategy::after_dash:
		if (auto dash = name.find('-'); dash != name.npos)
			return contains(filename, name.substr(dash + 1));
		return false;

	case Strategy::tokens:
	{
		auto tokens = alnum_tokens(name);
		auto target = to_lower(filename);
		std::size_t pos = 0;
		for (auto&& token : tokens)
		{
			pos = target.find(token, pos);
			if (pos == target.npos)
				return false;
			pos += token.size();
		}
		return !tokens.empty();
	}

	case Strategy::normalized:
	{
		auto n = normalize(strip_tag_prefix(strip_number_prefix(name)));
		auto t = normalize(strip_tag_prefix(strip_number_prefix(filename)));
		return !n.empty() && !t.empty() && (contains(t, n) || contains(n, t));
	}
	}
	return false;
}

std::vector<BlobInfo> LegacyResolver::resolve(std::string_view name, const std::string& bucket, std::error_code& ec) const
{
	if (trim(name).empty())
	{
		ec = Error::invalid_argument;
		return {};
	}

	// one scan for all strategies
	auto all = m_store.find(BlobQuery{}, bucket, ec);
	if (ec)
		return {};

	for (auto strategy : all_strategies)
	{
		std::vector<BlobInfo> result;
		std::copy_if(all.begin(), all.end(), std::back_inserter(result), [strategy, name](auto& blob)
		{
			return match(strategy, name, blob);
		});

		if (!result.empty())
		{
			Log(LOG_DEBUG, "resolved \"%1%\" to %2% blob(s) with strategy %3%", name, result.size(), static_cast<int>(strategy));
			return result;
		}
	}
	return {};
}

} // end of namespace shg
