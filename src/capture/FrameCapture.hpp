// capture/FrameCapture.hpp
#pragma once
#include <atomic>
#include <QObject>
#include <QThread>
#include <QElapsedTimer>
#include <opencv2/videoio.hpp>
#include "include/types.hpp"
#include "error/AppError.hpp"

// 카메라 캡처 루프 (전용 QThread). frameReady 는 캡처 스레드에서 emit 된다.
class FrameCapture : public QObject {
	Q_OBJECT
public:
    explicit FrameCapture();
    ~FrameCapture() override;

    void setDevice(const QString& devPath) { devPath_ = devPath; useIndex_ = -1; }
    void setCameraIndex(int idx) { useIndex_ = idx; devPath_.clear(); }
    void setResolution(int w, int h) { w_ = w; h_ = h; }
    void setFps(double fps) { fpsReq_ = fps; }
    void setFourcc(int fourcc) { fourcc_ = fourcc; }
    void setUseV4L2(bool v) { useV4L2_ = v; }
    void setMaxOpenAttempts(int n) { maxOpenAttempts_ = n; }

    bool isRunning() const { return running_.load(); }

public slots:
    void start();
    // 루프 종료까지 대기. 반환 후에는 frameReady 가 더 이상 오지 않는다
    void stop();

signals:
    void frameReady(const Frame& frame);
    void cameraError(const QString& msg);
    void cameraFailed(ErrorCode code, const QString& msg);	// 최초 오픈 실패 (치명)

private slots:
    void loop();

private:
    bool openCamera();
    void closeCamera();
    bool readOne(cv::Mat& out);

    cv::VideoCapture cap_;
    QString devPath_;
    int useIndex_{0};
    int w_{640}, h_{480};
    double fpsReq_{30.0};
    int fourcc_{0};
    bool useV4L2_{true};

    QThread worker_;
    std::atomic_bool running_{false};
    uint64_t seq_{0};
    int failCount_{0};
    int maxOpenAttempts_{10};
    const int maxFailBeforeReopen_{10};
    const int reopenSleepMs_{300};
};
