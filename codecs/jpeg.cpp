#include "jpeg.hpp"

#include <string>
#include <vector>

#include <csetjmp>
#include <cstdio>

#include <jpeglib.h>
#include <jerror.h>

#include "../errors.hpp"

// libjpeg reports errors through callbacks that must not return, so they
// longjmp back into Jpeg_decoder::decode, which throws from there
struct Jpeg_error: public jpeg_error_mgr
{
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX] {};

    static void error_exit(j_common_ptr cinfo) noexcept
    {
        auto err = static_cast<Jpeg_error *>(cinfo->err);
        err->format_message(cinfo, err->message);
        std::longjmp(err->jump, 1);
    }

    // a truncated file is only a warning to libjpeg, which pads the rest of the image with gray
    static void emit_message(j_common_ptr cinfo, int msg_level) noexcept
    {
        if(msg_level < 0 && cinfo->err->msg_code == JWRN_JPEG_EOF)
            error_exit(cinfo);
    }
};

struct Jpeg_decompress
{
    jpeg_decompress_struct cinfo;
    Jpeg_error err;

    Jpeg_decompress()
    {
        cinfo.err = jpeg_std_error(&err);
        err.jpeg_error_mgr::error_exit = Jpeg_error::error_exit;
        err.jpeg_error_mgr::emit_message = Jpeg_error::emit_message;
        jpeg_create_decompress(&cinfo);
    }
    ~Jpeg_decompress()
    {
        jpeg_destroy_decompress(&cinfo);
    }

    Jpeg_decompress(const Jpeg_decompress &) = delete;
    Jpeg_decompress & operator=(const Jpeg_decompress &) = delete;
};

Image Jpeg_decoder::decode(std::istream & input)
{
    auto data = read_all(input);

    // declared before setjmp, so a longjmp never skips their destructors
    Jpeg_decompress jpeg;
    Image img;
    std::vector<JSAMPLE> scanline;

    if(setjmp(jpeg.err.jump))
        throw Decode_error{std::string{"Error reading JPEG file: "} + jpeg.err.message};

    jpeg_mem_src(&jpeg.cinfo, std::data(data), std::size(data));
    jpeg_read_header(&jpeg.cinfo, TRUE);

    jpeg.cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&jpeg.cinfo);

    if(jpeg.cinfo.output_components != 3)
        throw Decode_error{"Error reading JPEG file: unexpected component count " + std::to_string(jpeg.cinfo.output_components)};

    img.set_size(jpeg.cinfo.output_width, jpeg.cinfo.output_height);
    scanline.resize(jpeg.cinfo.output_width * 3);

    while(jpeg.cinfo.output_scanline < jpeg.cinfo.output_height)
    {
        auto row = jpeg.cinfo.output_scanline;
        auto row_ptr = std::data(scanline);
        jpeg_read_scanlines(&jpeg.cinfo, &row_ptr, 1);

        for(std::size_t col = 0; col < jpeg.cinfo.output_width; ++col)
            put(img, row, col, scanline[3 * col], scanline[3 * col + 1], scanline[3 * col + 2]);
    }

    jpeg_finish_decompress(&jpeg.cinfo);

    return img;
}
