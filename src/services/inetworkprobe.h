/**
 * @file inetworkprobe.h
 * @brief Interface for one-shot connectivity probes.
 */

#ifndef INETWORKPROBE_H
#define INETWORKPROBE_H

#include <QObject>
#include <QString>

/**
 * @brief Abstract single-shot reachability check.
 *
 * Each check() call produces exactly one probeFinished() or probeFailed().
 * NetworkMonitor polls a probe and turns results into online/offline
 * transitions.
 */
class INetworkProbe : public QObject
{
    Q_OBJECT

public:
    explicit INetworkProbe(QObject *parent = nullptr) : QObject(parent) {}
    ~INetworkProbe() override = default;

    /// @brief Starts a check. A check already in flight is not duplicated.
    virtual void check() = 0;

signals:
    /**
     * @brief Emitted with the result of a completed check.
     * @param connected A usable network interface exists.
     * @param reachable The probe target answered.
     */
    void probeFinished(bool connected, bool reachable);

    /// @brief Emitted when the check itself could not be carried out.
    void probeFailed(const QString &message);
};

#endif // INETWORKPROBE_H
