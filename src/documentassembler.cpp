#include "documentassembler.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

QImage DocumentAssembler::toQImage(const cv::Mat& frame)
{
    if (frame.empty()) {
        return QImage();
    }

    cv::Mat source = frame;
    if (frame.depth() != CV_8U) {
        frame.convertTo(source, CV_8U);
    }

    switch (source.channels()) {
        case 1: {
            QImage image(source.data, source.cols, source.rows,
                         static_cast<int>(source.step), QImage::Format_Grayscale8);
            return image.copy();
        }
        case 3: {
            cv::Mat rgb;
            cv::cvtColor(source, rgb, cv::COLOR_BGR2RGB);
            QImage image(rgb.data, rgb.cols, rgb.rows,
                         static_cast<int>(rgb.step), QImage::Format_RGB888);
            return image.copy();
        }
        case 4: {
            cv::Mat rgba;
            cv::cvtColor(source, rgba, cv::COLOR_BGRA2RGBA);
            QImage image(rgba.data, rgba.cols, rgba.rows,
                         static_cast<int>(rgba.step), QImage::Format_RGBA8888);
            return image.copy();
        }
        default:
            return QImage();
    }
}

bool DocumentAssembler::writePdf(const std::vector<cv::Mat>& frames,
                                 const QString& filePath,
                                 const QSizeF& pageSize)
{
    if (frames.empty()) {
        qWarning() << "DocumentAssembler: No frames to write to" << filePath;
        return false;
    }

    std::vector<QImage> pages;
    pages.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        QImage image = toQImage(frames[i]);
        if (image.isNull()) {
            qWarning() << "DocumentAssembler: Skipping empty frame" << i;
            continue;
        }
        pages.push_back(image);
    }

    if (pages.empty()) {
        qWarning() << "DocumentAssembler: None of the frames could be converted for" << filePath;
        return false;
    }

    QFileInfo fileInfo(filePath);
    if (!QDir().mkpath(fileInfo.absolutePath())) {
        qWarning() << "DocumentAssembler: Failed to create directory" << fileInfo.absolutePath();
        return false;
    }

    auto pageSizeFor = [&pageSize](const QImage& image) {
        if (pageSize.isValid() && !pageSize.isEmpty()) {
            return QPageSize(pageSize, QPageSize::Point);
        }
        return QPageSize(image.size(), QPageSize::Point);
    };

    // Create PDF with initial page size from first image
    QPdfWriter writer(filePath);
    writer.setResolution(96);
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setPageSize(pageSizeFor(pages.front()));

    QPainter painter;
    if (!painter.begin(&writer)) {
        qWarning() << "DocumentAssembler: Failed to open PDF for writing:" << filePath;
        return false;
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    for (size_t i = 0; i < pages.size(); ++i) {
        if (i > 0) {
            writer.setPageSize(pageSizeFor(pages[i]));
            writer.newPage();
        }

        // Draw image to fill the page
        QRect pageRect(0, 0, writer.width(), writer.height());
        painter.drawImage(pageRect, pages[i]);
    }

    painter.end();

    qDebug() << "DocumentAssembler: Wrote" << pages.size() << "pages to" << filePath;
    return true;
}

QString DocumentAssembler::pageImageName(int pageNumber)
{
    return QString("page_%1.png").arg(pageNumber, 3, 10, QChar('0'));
}

bool DocumentAssembler::writeImageFile(const QString& filePath, const cv::Mat& image)
{
    if (image.empty()) {
        return false;
    }

    QString suffix = QFileInfo(filePath).suffix().toLower();
    if (suffix.isEmpty()) {
        suffix = "png";
    }

    // Encode image to memory buffer
    std::vector<uchar> buffer;
    if (!cv::imencode("." + suffix.toStdString(), image, buffer)) {
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    qint64 written = file.write(reinterpret_cast<const char*>(buffer.data()),
                                static_cast<qint64>(buffer.size()));
    file.close();

    return written == static_cast<qint64>(buffer.size());
}

int DocumentAssembler::writeImages(const std::vector<cv::Mat>& frames, const QString& directory)
{
    if (frames.empty()) {
        qWarning() << "DocumentAssembler: No frames to write to" << directory;
        return -1;
    }

    QDir dir(directory);
    if (!dir.mkpath(".")) {
        qWarning() << "DocumentAssembler: Failed to create directory" << directory;
        return -1;
    }

    int written = 0;
    for (const cv::Mat& frame : frames) {
        if (frame.empty()) {
            continue;
        }

        QString path = dir.filePath(pageImageName(written + 1));
        if (!writeImageFile(path, frame)) {
            qWarning() << "DocumentAssembler: Failed to write image" << path;
            return -1;
        }
        written++;
    }

    return written;
}
