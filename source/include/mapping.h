// mapping.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <stddef.h>

#include <map>
#include <string>
#include <vector>

#include "observer.h"

namespace mapping
{
	enum class StreamType
	{
		Video,
		Audio,
		Subtitle,
		Data,
		Attachment,

		Unknown
	};

	// the letter used in stream selectors, eg. the 'a' in '0:a:1'. 0 for unknown.
	char typeIdent(StreamType type);
	StreamType typeFromName(const std::string& name);
	std::string typeName(StreamType type);

	struct Stream
	{
		// position among streams of the same type; this is what the transcoder
		// uses for '0:<type>:<index>' selectors.
		size_t index = 0;

		// position in the probe's stream list
		size_t globalIndex = 0;

		StreamType type = StreamType::Unknown;
		std::string codecName;

		// 0 if unknown
		int channels = 0;

		// keys are lowercase.
		std::map<std::string, std::string> tags;

		std::string tag(const std::string& key) const;
	};

	using StreamInventory = std::vector<Stream>;

	// for building inventories by hand; assigns the per-type indices.
	void addStream(StreamInventory& inv, StreamType type, const std::string& codec, int channels = 0,
		const std::map<std::string, std::string>& tags = { });

	std::string selector(StreamType type, size_t index);



	struct Classification
	{
		bool needsProcessing = false;

		std::vector<std::string> mapping;
		std::vector<std::string> encoding;
	};

	struct Extraction
	{
		size_t index = 0;
		std::string tag;
		std::vector<std::string> mapping;
	};

	enum class BucketId
	{
		Pre,
		Matched,
		Unmatched,
		Post
	};

	struct BucketEntry
	{
		size_t index = 0;
		std::vector<std::string> tokens;
	};

	using Bucket = std::vector<BucketEntry>;

	// the per-run accumulator. one of these is made for every call to buildPlan,
	// and classifiers only ever write through the reference they are handed.
	struct Buckets
	{
		Bucket pre;
		Bucket matched;
		Bucket unmatched;
		Bucket post;

		bool foundMatch = false;
		std::vector<Extraction> extractions;

		Bucket& get(BucketId id);
		const Bucket& get(BucketId id) const;
	};

	std::vector<std::string> flatten(const Bucket& bucket);


	struct MappingPlan
	{
		bool needsProcessing = false;

		std::vector<std::string> streamMapping;
		std::vector<std::string> streamEncoding;

		std::vector<std::string> mainOptions;
		std::vector<std::string> advancedOptions;

		// only the subtitle extractor fills this.
		std::vector<Extraction> extractions;
	};



	class StreamClassifier
	{
	public:
		virtual ~StreamClassifier() { }

		virtual std::string name() const = 0;

		// streams of types that this returns false for are copied through untouched.
		virtual bool handlesType(StreamType type) const = 0;

		virtual Classification classify(const Stream& strm, size_t position, Buckets& buckets,
			util::Observer* obs) const = 0;

		// called once all the streams were classified. may override plan.needsProcessing.
		virtual void assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const = 0;
	};

	// "-strict -2 -max_muxing_queue_size 4096", what every plan starts with.
	std::vector<std::string> defaultAdvancedOptions();

	MappingPlan buildPlan(const StreamInventory& streams, const StreamClassifier& classifier,
		util::Observer* obs = nullptr);




	// kbps as a string; channels <= 0 means unknown.
	std::string bitrateForChannels(int channels);
	int clampChannels(int channels);

	constexpr int MAX_AC3_CHANNELS = 6;




	enum class SelectionMode
	{
		All,
		Selected
	};

	struct CodecPolicy
	{
		std::string targetCodec = "ac3";
		std::string encoder = "ac3";

		SelectionMode mode = SelectionMode::All;
		std::vector<std::string> selectedCodecs = { "dts", "dca", "truehd", "mp3", "mp2", "aac" };

		bool advanced = false;
		std::string customOptions;
		std::string mainOptions;
		std::string advancedOptions;

		int maxMuxingQueueSize = 2048;
	};

	// the codecs that have their own entry in the selection list; "other" means anything else.
	const std::vector<std::string>& knownAudioCodecs();

	class CodecConversion : public StreamClassifier
	{
	public:
		explicit CodecConversion(const CodecPolicy& policy);

		std::string name() const override { return "codec-conversion"; }
		bool handlesType(StreamType type) const override;

		bool test(const Stream& strm) const;

		Classification classify(const Stream& strm, size_t position, Buckets& buckets,
			util::Observer* obs) const override;

		void assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const override;

		const CodecPolicy& policy() const { return this->pol; }

	private:
		CodecPolicy pol;
	};




	struct SubtitlePolicy
	{
		std::string languages;
		bool includeTitle = true;

		// whatever the sidecar recorded for this file last time; non-empty means done.
		std::string priorMarker;
	};

	std::vector<std::string> parseLanguageList(const std::string& list);
	std::string extractionTag(const Stream& strm, size_t position, bool includeTitle);

	class SubtitleExtraction : public StreamClassifier
	{
	public:
		explicit SubtitleExtraction(const SubtitlePolicy& policy);

		std::string name() const override { return "subtitle-extraction"; }
		bool handlesType(StreamType type) const override;

		bool test(const Stream& strm) const;
		bool alreadyExtracted() const;

		Classification classify(const Stream& strm, size_t position, Buckets& buckets,
			util::Observer* obs) const override;

		void assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const override;

		const std::vector<std::string>& languages() const { return this->langs; }

	private:
		SubtitlePolicy pol;
		std::vector<std::string> langs;
	};

	// what gets written into the sidecar after a successful extraction.
	std::string extractedLanguages(const StreamInventory& streams, const std::vector<std::string>& filter);




	struct ReorderPolicy
	{
		std::string searchString = "eng";
		StreamType streamType = StreamType::Audio;
	};

	class LanguageReorder : public StreamClassifier
	{
	public:
		explicit LanguageReorder(const ReorderPolicy& policy);

		std::string name() const override { return "language-reorder"; }
		bool handlesType(StreamType type) const override;

		bool matches(const Stream& strm) const;

		Classification classify(const Stream& strm, size_t position, Buckets& buckets,
			util::Observer* obs) const override;

		void assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const override;

		const std::string& searchString() const { return this->search; }

	private:
		ReorderPolicy pol;
		std::string search;
	};

	bool streamsToBeReordered(const Buckets& buckets);
}
