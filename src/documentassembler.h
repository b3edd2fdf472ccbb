#ifndef DOCUMENTASSEMBLER_H
#define DOCUMENTASSEMBLER_H

#include <vector>
#include <QImage>
#include <QSizeF>
#include <QString>
#include <opencv2/opencv.hpp>

/**
 * Writes selected keyframes as a paged document and as numbered images
 */
class DocumentAssembler
{
public:
    /**
     * Write one PDF page per frame, in order
     * @param frames Frames to write (empty frames are skipped)
     * @param filePath Output PDF path
     * @param pageSize Fixed page size in points; invalid size sizes each page to its frame
     * @return true if at least one page was written
     */
    static bool writePdf(const std::vector<cv::Mat>& frames,
                         const QString& filePath,
                         const QSizeF& pageSize = QSizeF());

    /**
     * Write frames as page_001.png, page_002.png, ... into a directory
     * @param frames Frames to write
     * @param directory Output directory, created when missing
     * @return Number of images written, -1 on failure
     */
    static int writeImages(const std::vector<cv::Mat>& frames, const QString& directory);

    /**
     * File name of the n-th page image (1-based)
     */
    static QString pageImageName(int pageNumber);

    /**
     * Convert a BGR, BGRA or grayscale frame to a detached QImage
     */
    static QImage toQImage(const cv::Mat& frame);

    /**
     * Write an image through Qt file APIs so non-ASCII paths work on every platform
     * @param filePath Destination path; its extension selects the encoder
     * @param image Frame to encode
     * @return true if the whole encoded buffer was written
     */
    static bool writeImageFile(const QString& filePath, const cv::Mat& image);
};

#endif // DOCUMENTASSEMBLER_H
