#include "ByteSource.h"
#include <algorithm>
#include <cstring>

namespace testsum {

std::size_t StringSource::read(char* buf, std::size_t len){
    if(pos_ >= data_.size()) return 0;
    std::size_t n = std::min({len, chunk_size_, data_.size() - pos_});
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

}
