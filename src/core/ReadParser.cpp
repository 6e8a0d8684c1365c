#include "core/ReadParser.hpp"

namespace MiteSeq {

bool ReadParser::should_keep(const bam1_t* b) {
    uint16_t flag = b->core.flag;
    return !(flag & BAM_FSECONDARY) && !(flag & BAM_FSUPPLEMENTARY);
}

AlignedRead ReadParser::parse(const bam1_t* b) {
    AlignedRead read;
    read.name = bam_get_qname(b);

    uint16_t flag = b->core.flag;
    read.is_mapped = !(flag & BAM_FUNMAP);
    read.is_paired = (flag & BAM_FPAIRED) != 0;
    read.start = static_cast<int32_t>(b->core.pos);  // 0-based

    const uint32_t* cigar = bam_get_cigar(b);
    read.cigar.reserve(b->core.n_cigar);
    for (uint32_t i = 0; i < b->core.n_cigar; ++i) {
        read.cigar.push_back(CigarElement{bam_cigar_opchr(cigar[i]), bam_cigar_oplen(cigar[i])});
    }

    const int32_t len = b->core.l_qseq;
    const uint8_t* seq = bam_get_seq(b);
    const uint8_t* qual = bam_get_qual(b);
    read.bases.resize(len);
    read.quals.resize(len);
    const bool has_quals = len > 0 && qual[0] != 0xff;
    for (int32_t i = 0; i < len; ++i) {
        read.bases[i] = seq_nt16_str[bam_seqi(seq, i)];
        read.quals[i] = has_quals ? qual[i] : 0;
    }

    return read;
}

}  // namespace MiteSeq
