// capture/FrameCapture.cpp
#include "FrameCapture.hpp"
#include <QDebug>
#include <QThread>
#include <string>
#include "logger.hpp"

FrameCapture::FrameCapture()
		: QObject(nullptr)
{
    qRegisterMetaType<Frame>("Frame");
    worker_.setObjectName(QStringLiteral("FrameCapture"));
    connect(&worker_, &QThread::started, this, &FrameCapture::loop, Qt::QueuedConnection);
    moveToThread(&worker_);
}

FrameCapture::~FrameCapture(){
	stop();
}

void FrameCapture::start(){
	if (running_.exchange(true)) return;
	worker_.start();
}

void FrameCapture::stop() {
	running_ = false;
	if (QThread::currentThread() == &worker_) return;	// 루프 내부에서 호출된 경우

	if (worker_.isRunning()) {
		worker_.quit();
		worker_.wait();
	}
}

bool FrameCapture::openCamera() {
    closeCamera();
    if (useV4L2_) {
        if (!devPath_.isEmpty()) {
            if (!cap_.open(devPath_.toStdString(), cv::CAP_V4L2)) return false;
        } else {
            if (!cap_.open(useIndex_, cv::CAP_V4L2)) return false;
        }
    } else {
        if (!devPath_.isEmpty()) { if (!cap_.open(devPath_.toStdString())) return false; }
        else { if (!cap_.open(useIndex_)) return false; }
    }
    if (fourcc_) cap_.set(cv::CAP_PROP_FOURCC, fourcc_);
    if (w_>0) cap_.set(cv::CAP_PROP_FRAME_WIDTH,  w_);
    if (h_>0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, h_);
    if (fpsReq_>0) cap_.set(cv::CAP_PROP_FPS, fpsReq_);
    qInfo() << "[FrameCapture] opened" << (devPath_.isEmpty() ? QString("[index]%1").arg(useIndex_) : "[V4L2] "+devPath_)
            << " -> " << int(cap_.get(cv::CAP_PROP_FRAME_WIDTH)) << "x" << int(cap_.get(cv::CAP_PROP_FRAME_HEIGHT))
            << "@" << cap_.get(cv::CAP_PROP_FPS);
    return true;
}

void FrameCapture::closeCamera(){ if (cap_.isOpened()) cap_.release(); }

bool FrameCapture::readOne(cv::Mat& out) {
    return cap_.read(out) && !out.empty();
}

void FrameCapture::loop() {
    // === 최초 오픈: maxOpenAttempts_ 회 실패하면 치명 오류 ===
    int attempts = 0;
    bool opened = false;
    try {
        while (running_.load() && !(opened = openCamera())) {
            if (maxOpenAttempts_ > 0 && ++attempts >= maxOpenAttempts_) break;
            QThread::msleep(reopenSleepMs_);
        }
    } catch (const cv::Exception& e) {
        qWarning() << "[FrameCapture] open threw:" << e.what();
        opened = false;
    }
    if (!opened) {
        if (running_.load()) {
            const ErrorCode code = (attempts >= maxOpenAttempts_) ? ErrorCode::CameraUnavailable
                                                                  : ErrorCode::CameraStartFailed;
            Logger::writef("[FrameCapture] cannot open camera %s after %d attempts",
                           devPath_.isEmpty() ? std::to_string(useIndex_).c_str() : devPath_.toStdString().c_str(),
                           attempts);
            emit cameraFailed(code, QStringLiteral("[FrameCapture] cannot open camera"));
        }
        running_ = false;
        closeCamera();
        return;
    }

    QElapsedTimer tick; tick.start();
    const int sleepFloorMs = 1;

    while (running_.load()) {
        if (!cap_.isOpened()) { if (!openCamera()) { QThread::msleep(reopenSleepMs_); continue; } }

        Frame f;
        if (!readOne(f.image)) {
            if (++failCount_ >= maxFailBeforeReopen_) {
                LOG_WARN(QStringLiteral("read failed %1 times, reopening").arg(failCount_));
                emit cameraError("[FrameCapture] read fail threshold, reopening...");
                closeCamera(); QThread::msleep(reopenSleepMs_); failCount_ = 0;
            } else {
                QThread::msleep(5);
            }
            continue;
        }
        failCount_ = 0;
        f.tsMs = QElapsedTimer::msecsSinceReference();
        f.seq  = ++seq_;
        emit frameReady(f);

        if (fpsReq_ > 0) {
            int targetMs = int(1000.0 / fpsReq_);
            int sleepMs = targetMs - int(tick.restart());
            if (sleepMs < sleepFloorMs) sleepMs = sleepFloorMs;
            QThread::msleep(sleepMs);
        } else {
            QThread::msleep(sleepFloorMs);
        }
    }
    closeCamera();
}
