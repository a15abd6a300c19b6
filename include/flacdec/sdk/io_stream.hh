/**
 * @file io_stream.hh
 * @brief Binary input stream abstraction
 * @ingroup sdk_io
 */

#ifndef FLACDEC_SDK_IO_STREAM_H
#define FLACDEC_SDK_IO_STREAM_H

#include <flacdec/sdk/types.hh>
#include <flacdec/export_flacdec.h>
#include <memory>

namespace flacdec {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< Seek from beginning of stream (SEEK_SET)
    cur = 1,  ///< Seek from current position (SEEK_CUR)
    end = 2   ///< Seek from end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract byte source consumed by the decoder
 * @ingroup sdk_io
 *
 * The decoder only ever reads sequentially. Seeking is used while the
 * metadata blocks are skipped at open time and when the stream decoder is
 * reset to the first frame.
 *
 * ## Using I/O Streams
 *
 * @code
 * // Open file stream
 * auto stream = io_from_file("audio.flac");
 *
 * // Or wrap a buffer that is already in memory
 * std::vector<uint8_t> data = load_data();
 * auto mem_stream = io_from_memory(data.data(), data.size());
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), stream_decoder
 */
class io_stream {
public:
    /**
     * @brief Virtual destructor
     */
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data from stream
     *
     * @param ptr Buffer to read into
     * @param size_bytes Number of bytes to read
     * @return Actual number of bytes read (may be less than requested)
     *
     * @note Returns 0 on EOF or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Seek to a position in the stream
     *
     * @param offset Byte offset from origin
     * @param whence Origin for seek operation
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @brief Get current position in stream
     * @return Current byte position from start, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @brief Get total size of stream
     * @return Total size in bytes, or -1 if unknown/unlimited
     */
    virtual int64_t get_size() = 0;

    /**
     * @brief Close the stream
     * @note After closing, all operations except is_open() are undefined
     */
    virtual void close() = 0;

    /**
     * @brief Check if stream is open and usable
     * @return true if stream is open
     */
    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @defgroup io_endian Big-endian read helpers
 * @ingroup sdk_io
 * @brief FLAC stores every multi-byte field big-endian
 * @{
 */

/**
 * @brief Read unsigned 8-bit value
 * @param stream Stream to read from
 * @param[out] value Value read
 * @return true on success, false on error
 */
FLACDEC_EXPORT bool read_u8(io_stream* stream, uint8_t* value);

/**
 * @brief Read unsigned 24-bit big-endian value
 *
 * Metadata block lengths are 24-bit fields.
 *
 * @param stream Stream to read from
 * @param[out] value Value read (converted to native endian)
 * @return true on success, false on error
 */
FLACDEC_EXPORT bool read_u24be(io_stream* stream, uint32_t* value);

/** @} */ // end of io_endian group

/**
 * @defgroup io_factory I/O Stream Factory Functions
 * @ingroup sdk_io
 * @{
 */

/**
 * @brief Create a read-only file-based I/O stream
 *
 * @param filename Path to file
 * @return New io_stream, or nullptr if the file can not be opened
 */
FLACDEC_EXPORT std::unique_ptr<io_stream> io_from_file(const char* filename);

/**
 * @brief Create a read-only memory-based I/O stream
 *
 * @param mem Pointer to memory buffer
 * @param size_bytes Size of buffer in bytes
 * @return New io_stream
 *
 * @note The memory must remain valid for the lifetime of the stream
 */
FLACDEC_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/** @} */ // end of io_factory group

} // namespace flacdec

#endif // FLACDEC_SDK_IO_STREAM_H
