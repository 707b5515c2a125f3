// sidecar.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>
#include <fstream>

#include "defs.h"
#include "sidecar.h"

namespace sidecar
{
	std::string Document::get(const std::string& section, const std::string& key) const
	{
		auto k = util::lowercase(key);
		for(const auto& sec : this->sections)
		{
			if(sec.name != section)
				continue;

			for(const auto& [ name, value ] : sec.entries)
			{
				if(util::lowercase(name) == k)
					return value;
			}
		}

		return "";
	}

	void Document::set(const std::string& section, const std::string& key, const std::string& value)
	{
		auto k = util::lowercase(key);

		Section* sec = nullptr;
		for(auto& s : this->sections)
		{
			if(s.name == section)
			{
				sec = &s;
				break;
			}
		}

		if(!sec)
		{
			this->sections.push_back(Section { section, { } });
			sec = &this->sections.back();
		}

		for(auto& entry : sec->entries)
		{
			if(util::lowercase(entry.first) == k)
			{
				entry.second = value;
				return;
			}
		}

		sec->entries.push_back({ key, value });
	}

	// file names can have anything in them, so keys that would not survive a plain
	// 'key = value' line are written as "key", with backslash escapes for " and \.
	static bool needs_quoting(const std::string& key)
	{
		if(key.empty() || key != util::trim(key))
			return true;

		if(strchr("#;[\"", key[0]) != nullptr)
			return true;

		return key.find_first_of("=:") != std::string::npos;
	}

	static std::string quote_key(const std::string& key)
	{
		if(!needs_quoting(key))
			return key;

		std::string ret = "\"";
		for(char c : key)
		{
			if(c == '"' || c == '\\') ret += '\\';
			ret += c;
		}

		return ret + "\"";
	}

	// parses '"key" = value'; false if the line isn't one.
	static bool parse_quoted_entry(const std::string& line, std::string& key, std::string& value)
	{
		key.clear();

		size_t i = 1;
		for(; i < line.size() && line[i] != '"'; i++)
		{
			if(line[i] == '\\' && i + 1 < line.size())
				i++;

			key += line[i];
		}

		if(i >= line.size())
			return false;

		auto rest = util::trim(line.substr(i + 1));
		if(rest.empty() || (rest[0] != '=' && rest[0] != ':'))
			return false;

		value = util::trim(rest.substr(1));
		return true;
	}

	Document parse(const std::string& text)
	{
		Document doc;

		auto section_re = std::regex("^\\[(.+)\\]\\s*$");
		auto entry_re   = std::regex("^([^=:]+?)\\s*[=:]\\s?(.*)$");

		size_t lineNum = 0;
		for(auto line : util::splitString(text))
		{
			lineNum++;

			if(!line.empty() && line.back() == '\r')
				line.pop_back();

			auto trimmed = util::trim(line);
			if(trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
				continue;

			// indented lines continue the previous value
			if(isspace(static_cast<unsigned char>(line[0])) && !doc.sections.empty()
				&& !doc.sections.back().entries.empty())
			{
				auto& val = doc.sections.back().entries.back().second;
				val += (val.empty() ? "" : "\n") + trimmed;
				continue;
			}

			std::smatch sm;
			std::string key;
			std::string value;

			bool isEntry = false;
			if(trimmed[0] == '"')
			{
				if(!parse_quoted_entry(trimmed, key, value))
				{
					doc.error = zpr::sprint("line %d: unterminated key '%s'", lineNum, trimmed);
					return doc;
				}

				isEntry = true;
			}
			else if(std::regex_match(trimmed, sm, section_re))
			{
				doc.sections.push_back(Section { sm[1].str(), { } });
			}
			else if(std::regex_match(trimmed, sm, entry_re))
			{
				key = util::trim(sm[1].str());
				value = util::trim(sm[2].str());
				isEntry = true;
			}
			else
			{
				doc.error = zpr::sprint("line %d: could not parse '%s'", lineNum, trimmed);
				return doc;
			}

			if(isEntry)
			{
				if(doc.sections.empty())
				{
					doc.error = zpr::sprint("line %d: entry outside of any section", lineNum);
					return doc;
				}

				doc.sections.back().entries.push_back({ key, value });
			}
		}

		doc.valid = true;
		return doc;
	}

	std::string serialise(const Document& doc)
	{
		std::string ret;
		for(const auto& sec : doc.sections)
		{
			ret += zpr::sprint("[%s]\n", sec.name);
			for(const auto& [ k, v ] : sec.entries)
				ret += zpr::sprint("%s = %s\n", quote_key(k), v);

			ret += "\n";
		}

		return ret;
	}

	std::fs::path sidecarPath(const std::fs::path& mediaFile)
	{
		return mediaFile.parent_path() / FILE_NAME;
	}

	static Document read_document(const std::fs::path& path)
	{
		std::error_code ec;
		if(!std::fs::exists(path, ec) || ec)
		{
			// no file is the same as an empty one.
			Document doc;
			doc.valid = true;
			return doc;
		}

		auto [ buf, sz ] = util::readEntireFile(path.string());
		if(!buf)
		{
			Document doc;
			doc.error = zpr::sprint("failed to read '%s'", path.string());
			return doc;
		}

		auto text = std::string(reinterpret_cast<char*>(buf), sz);
		delete[] buf;

		return parse(text);
	}

	std::string readMarker(const std::fs::path& mediaFile, const std::string& section)
	{
		auto doc = read_document(sidecarPath(mediaFile));
		if(!doc.valid)
			return "";

		return doc.get(section, mediaFile.filename().string());
	}

	bool writeMarker(const std::fs::path& mediaFile, const std::string& section, const std::string& value)
	{
		auto path = sidecarPath(mediaFile);

		auto doc = read_document(path);
		if(!doc.valid)
		{
			// it's broken anyway, so start over rather than refusing to record anything.
			util::warn("ignoring malformed '%s' (%s)", path.string(), doc.error);
			doc = Document();
			doc.valid = true;
		}

		doc.set(section, mediaFile.filename().string(), value);

		auto out = std::ofstream(path, std::ios::out | std::ios::trunc);
		if(!out.good())
			return false;

		out << serialise(doc);
		out.close();

		return !out.fail();
	}
}
