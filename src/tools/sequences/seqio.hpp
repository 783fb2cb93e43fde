#pragma once

#include "line_reader.hpp"
#include "common/string_utils.hpp"
#include <experimental/filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace io{
    struct SeqRecord {
        std::string id;
        std::string seq;

        SeqRecord() = default;
        SeqRecord(std::string _seq, std::string _id) : id(std::move(_id)), seq(std::move(_seq)) {}

        bool isNull() const {return id.empty() && seq.empty();}
        size_t size() const {return seq.size();}
    };

    class ISeqReader;

    class SeqIterator{
    private:
        ISeqReader &reader;
        bool isend;
    public:
        typedef SeqRecord value_type;
        SeqIterator(ISeqReader &_reader, bool _isend);
        void operator++();
        SeqRecord operator*();
        bool operator==(const SeqIterator &other) const;
        bool operator!=(const SeqIterator &other) const;
    };

    class ISeqReader {
    protected:
        SeqRecord next{};
    public:
        virtual ~ISeqReader() = default;
        const SeqRecord& get() const {return next;}
        bool eof() const {return next.isNull();}
        virtual void inner_read() = 0;
        SeqIterator begin();
        SeqIterator end();
    };

    class FASTAReader final : public ISeqReader {
    private:
        LineReader reader;
        std::string header;
    public:
        explicit FASTAReader(const std::experimental::filesystem::path &_file_name);
        void inner_read() override;
    };

    class FASTQReader final: public ISeqReader {
    private:
        LineReader reader;
    public:
        explicit FASTQReader(const std::experimental::filesystem::path& _file_name);
        void inner_read() override;
    };

    // Reader chosen by file extension (.fasta/.fa/.fna/.fastq/.fq, optionally .gz).
    std::unique_ptr<ISeqReader> OpenSeqReader(const std::experimental::filesystem::path &file_name);
    bool IsSequenceFile(const std::experimental::filesystem::path &file_name);
}
