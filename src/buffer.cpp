#include "buffer.h"
#include <cerrno>
#include <sys/uio.h>

const char Buffer::kCRLF[] = "\r\n";

ssize_t Buffer::readFd(int fd, int* saved_errno){
    char extrabuf[65536]; // 栈上的备用空间，避免为每个连接预分配大缓冲区
    struct iovec vec[2];
    const size_t writable = writableBytes();

    vec[0].iov_base = beginWrite();
    vec[0].iov_len = writable;
    vec[1].iov_base = extrabuf;
    vec[1].iov_len = sizeof(extrabuf);

    const int iovcnt = (writable < sizeof(extrabuf)) ? 2 : 1;
    const ssize_t n = ::readv(fd, vec, iovcnt);

    if(n < 0){
        *saved_errno = errno;
    }else if(static_cast<size_t>(n) <= writable){
        write_index_ += n;
    }else{
        write_index_ = buffer_.size();
        append(extrabuf, n - writable);
    }
    return n;
}

void Buffer::makeSpace(size_t len){
    if(writableBytes() + prependableBytes() < len + kCheapPrepend){
        buffer_.resize(write_index_ + len);
    }else{
        // 空间够用，把可读数据挪到前面
        size_t readable = readableBytes();
        std::copy(begin() + reader_index_,
                  begin() + write_index_,
                  begin() + kCheapPrepend);
        reader_index_ = kCheapPrepend;
        write_index_ = reader_index_ + readable;
    }
}
