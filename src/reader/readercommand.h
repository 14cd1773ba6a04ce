#ifndef BLINKREADER_READERCOMMAND_H
#define BLINKREADER_READERCOMMAND_H

// Discrete commands accepted by the reading state machine. The keyboard and
// the control bar map 1:1 onto these.
enum class ReaderCommand {
    Play,
    Pause,
    TogglePlayPause,
    Stop,
    SkipForward,
    SkipBackward,
    IncreaseSpeed,
    DecreaseSpeed,
    Restart,
};

#endif // BLINKREADER_READERCOMMAND_H
